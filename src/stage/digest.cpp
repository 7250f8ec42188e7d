#include "ctxstage/stager.hpp"
#include "ctxstage/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace ctxstage {

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool update(EvpMdCtx& ctx, const std::string& s) {
    // Length-prefix each field so concatenations cannot collide
    std::string framed = std::to_string(s.size()) + ":" + s;
    return EVP_DigestUpdate(ctx.get(), framed.data(), framed.size()) == 1;
}

bool update_file(EvpMdCtx& ctx, const std::string& path, std::string& error) {
    auto size = file_size(path);
    std::ifstream file(path, std::ios::binary);
    if (!file || !size) {
        error = "failed to open file: " + path;
        return false;
    }

    std::string header = std::to_string(*size) + ":";
    if (EVP_DigestUpdate(ctx.get(), header.data(), header.size()) != 1) {
        error = "EVP_DigestUpdate failed";
        return false;
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            error = "EVP_DigestUpdate failed";
            return false;
        }
    }
    return true;
}

} // namespace

DigestResult compute_tree_digest(const std::string& root) {
    DigestResult result;

    if (!is_directory(root)) {
        result.error = "not a directory: " + root;
        return result;
    }

    std::vector<fs::path> entries;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        result.error = "failed to walk '" + root + "': " + ec.message();
        return result;
    }

    std::vector<std::string> relative;
    relative.reserve(entries.size());
    for (const auto& p : entries) {
        relative.push_back(p.lexically_relative(root).string());
    }
    std::sort(relative.begin(), relative.end());

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    for (const auto& rel : relative) {
        std::string full = join_path(root, rel);
        auto status = fs::symlink_status(full, ec);
        if (ec) {
            result.error = "failed to stat '" + full + "': " + ec.message();
            return result;
        }

        std::string kind;
        switch (status.type()) {
            case fs::file_type::regular: kind = "f"; break;
            case fs::file_type::directory: kind = "d"; break;
            case fs::file_type::symlink: kind = "l"; break;
            default: kind = "o"; break;
        }

        char mode[8];
        snprintf(mode, sizeof(mode), "%04o",
                 static_cast<unsigned>(status.permissions() & fs::perms::mask));

        if (!update(ctx, rel) || !update(ctx, kind) || !update(ctx, mode)) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }

        if (kind == "f" && !update_file(ctx, full, result.error)) {
            return result;
        }
        if (kind == "l") {
            auto target = fs::read_symlink(full, ec);
            if (ec || !update(ctx, target.string())) {
                result.error = "failed to read symlink '" + full + "'";
                return result;
            }
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.entry_count = relative.size();
    result.ok = true;
    return result;
}

} // namespace ctxstage
