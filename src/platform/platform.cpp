#include "ctxstage/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <pwd.h>
#include <sys/stat.h>

extern "C" char** environ;

namespace ctxstage {

namespace fs = std::filesystem;

namespace {

bool fsync_fd(int fd) {
    return fsync(fd) == 0;
}

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

std::string format_utc_now(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[64];
    std::strftime(buf, sizeof(buf), format, &tm_buf);
    return buf;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    size_t total = 0;
    while (total < content.size()) {
        ssize_t written = write(fd, content.data() + total, content.size() - total);
        if (written < 0) {
            if (errno == EINTR) continue;
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write content: " + std::string(strerror(errno));
            return result;
        }
        total += static_cast<size_t>(written);
    }

    if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to set mode: " + std::string(strerror(errno));
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

std::string expand_user_path(const std::string& path) {
    std::string expanded = path;
    if (!expanded.empty() && expanded[0] == '~' &&
        (expanded.size() == 1 || expanded[1] == '/')) {
        if (auto home = get_env("HOME")) {
            expanded = *home + expanded.substr(1);
        }
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(expanded, ec);
    if (ec) return expanded;
    return absolute.lexically_normal().string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::uintmax_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }
    std::sort(entries.begin(), entries.end());

    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path, std::string* error) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        if (error) *error = ec.message();
        return false;
    }
    if (!removed && error) {
        *error = "no such file";
    }
    return removed;
}

bool copy_file(const std::string& src, const std::string& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    return !ec;
}

bool set_mode(const std::string& path, unsigned mode) {
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    return !ec;
}

std::optional<unsigned> get_mode(const std::string& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) return std::nullopt;
    return static_cast<unsigned>(status.permissions() & fs::perms::mask);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return ss.str();
}

std::string temp_directory() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    if (ec) return "/tmp";
    return p.string();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }

    return env;
}

std::string get_current_user() {
    if (auto user = get_env("USER")) {
        if (!user->empty()) return *user;
    }
    if (const passwd* pw = getpwuid(geteuid())) {
        if (pw->pw_name) return pw->pw_name;
    }
    return "unknown";
}

std::string get_current_timestamp() {
    return format_utc_now("%Y-%m-%dT%H:%M:%SZ");
}

std::string get_log_timestamp() {
    return format_utc_now("%Y-%m-%d_%H-%M-%S");
}

} // namespace ctxstage
