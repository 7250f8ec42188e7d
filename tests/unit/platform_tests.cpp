#include <doctest/doctest.h>
#include <ctxstage/platform.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;
using namespace ctxstage;

namespace {

class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "ctxstage_platform_test_XXXXXX").string();
        REQUIRE(mkdtemp(pattern.data()) != nullptr);
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// Atomic Writes
// ============================================================================

TEST_CASE("atomic_write_file writes content with the requested mode") {
    TempDir temp;
    std::string path = temp.path() + "/run.sh";

    auto result = atomic_write_file(path, "#!/bin/sh\necho hi\n", 0775);
    REQUIRE(result.ok);

    auto content = read_file(path);
    REQUIRE(content.has_value());
    CHECK(*content == "#!/bin/sh\necho hi\n");

    auto mode = get_mode(path);
    REQUIRE(mode.has_value());
    CHECK(*mode == 0775);
}

TEST_CASE("atomic_write_file replaces an existing file and leaves no temp files") {
    TempDir temp;
    std::string path = temp.path() + "/data.txt";

    REQUIRE(atomic_write_file(path, "old", 0664).ok);
    REQUIRE(atomic_write_file(path, "new", 0664).ok);

    CHECK(*read_file(path) == "new");
    CHECK(list_directory(temp.path()) == std::vector<std::string>{"data.txt"});
}

TEST_CASE("atomic_write_file fails when the directory is missing") {
    TempDir temp;
    auto result = atomic_write_file(temp.path() + "/missing/file.txt", "x", 0664);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

// ============================================================================
// Paths and Files
// ============================================================================

TEST_CASE("join_path and path components") {
    CHECK(join_path("/a/b", "c.txt") == "/a/b/c.txt");
    CHECK(join_path("/a/b/", "c/d") == "/a/b/c/d");
    CHECK(get_parent_directory("/a/b/c.txt") == "/a/b");
}

TEST_CASE("expand_user_path expands the home directory") {
    auto home = get_env("HOME");
    REQUIRE(home.has_value());

    std::string expanded = expand_user_path("~/manifests/build.json");
    CHECK(expanded == fs::path(*home + "/manifests/build.json").lexically_normal().string());
}

TEST_CASE("expand_user_path makes relative paths absolute") {
    std::string expanded = expand_user_path("some/dir/../file");
    CHECK(fs::path(expanded).is_absolute());
    CHECK(expanded.find("..") == std::string::npos);
}

TEST_CASE("remove_file reports a missing file") {
    TempDir temp;
    std::string error;
    CHECK_FALSE(remove_file(temp.path() + "/nothing", &error));
    CHECK(error == "no such file");
}

TEST_CASE("remove_file removes an existing file") {
    TempDir temp;
    std::string path = temp.path() + "/f";
    std::ofstream(path) << "x";
    CHECK(remove_file(path));
    CHECK_FALSE(path_exists(path));
}

TEST_CASE("list_directory is sorted") {
    TempDir temp;
    std::ofstream(temp.path() + "/b") << "";
    std::ofstream(temp.path() + "/a") << "";
    fs::create_directory(temp.path() + "/c");

    CHECK(list_directory(temp.path()) == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("file_size of missing file is empty") {
    CHECK_FALSE(file_size("/nonexistent/ctxstage/file").has_value());
}

// ============================================================================
// Environment and Time
// ============================================================================

TEST_CASE("get_env returns set variables only") {
    setenv("CTXSTAGE_TEST_VAR", "value", 1);
    CHECK(get_env("CTXSTAGE_TEST_VAR") == std::optional<std::string>("value"));
    unsetenv("CTXSTAGE_TEST_VAR");
    CHECK_FALSE(get_env("CTXSTAGE_TEST_VAR").has_value());
}

TEST_CASE("get_current_user is never empty") {
    CHECK_FALSE(get_current_user().empty());
}

TEST_CASE("timestamps have the expected shape") {
    CHECK(std::regex_match(get_log_timestamp(),
                           std::regex(R"(\d{4}-\d{2}-\d{2}_\d{2}-\d{2}-\d{2})")));
    CHECK(std::regex_match(get_current_timestamp(),
                           std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));
}
