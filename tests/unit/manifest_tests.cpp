#include <doctest/doctest.h>
#include <ctxstage/manifest.hpp>
#include <ctxstage/platform.hpp>

#include <filesystem>
#include <fstream>

#include <stdlib.h>

namespace fs = std::filesystem;
using namespace ctxstage;

namespace {

class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "ctxstage_manifest_test_XXXXXX").string();
        REQUIRE(mkdtemp(pattern.data()) != nullptr);
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

    std::string write(const std::string& name, const std::string& content) const {
        std::string full = path() + "/" + name;
        std::ofstream(full, std::ios::binary) << content;
        return full;
    }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// Manifest container
// ============================================================================

TEST_CASE("manifest iterates in destination name order") {
    Manifest m;
    REQUIRE(m.add(create_entry("zeta", EmptyKind::File)));
    REQUIRE(m.add(copy_entry("alpha", "/src/a")));
    REQUIRE(m.add(create_entry("mid/dir", EmptyKind::Directory)));

    std::vector<std::string> names;
    for (const auto& [name, entry] : m.entries()) {
        names.push_back(name);
    }
    CHECK(names == std::vector<std::string>{"alpha", "mid/dir", "zeta"});
}

TEST_CASE("manifest rejects duplicate destinations") {
    Manifest m;
    REQUIRE(m.add(copy_entry("install.sh", "/src/a", true)));

    std::string error;
    CHECK_FALSE(m.add(copy_entry("install.sh", "/src/b"), &error));
    CHECK(error.find("duplicate destination 'install.sh'") != std::string::npos);

    // First entry is untouched
    const auto* entry = m.find("install.sh");
    REQUIRE(entry != nullptr);
    CHECK(entry->executable);
    CHECK(std::get<CopyAction>(entry->action).source_path == "/src/a");
}

TEST_CASE("manifest put replaces an entry") {
    Manifest m;
    m.put(copy_entry("f", "/a"));
    m.put(copy_entry("f", "/b", true));
    CHECK(m.size() == 1);
    CHECK(std::get<CopyAction>(m.find("f")->action).source_path == "/b");
    CHECK(m.find("f")->executable);
}

TEST_CASE("action names") {
    CHECK(std::string(action_name(copy_entry("a", "b").action)) == "copy");
    CHECK(std::string(action_name(render_entry("a", "b", nlohmann::json::object()).action)) ==
          "render");
    CHECK(std::string(action_name(create_entry("a", EmptyKind::File).action)) == "create");
}

TEST_CASE("permission classes") {
    CHECK(mode_for(true) == 0775);
    CHECK(mode_for(false) == 0664);
}

// ============================================================================
// Manifest file parsing
// ============================================================================

TEST_CASE("parse manifest with all action kinds") {
    TempDir temp;
    temp.write("packages.txt", "ros-humble-desktop\n");

    std::string json = R"({
        "$schema": "ctxstage.manifest.v1",
        "build_file": "Containerfile",
        "context_files": { "ros_packages": "packages.txt" },
        "entries": {
            "Containerfile": { "render": "Containerfile.j2", "context": { "use_env": true } },
            "install.sh": { "copy": "scripts/install.sh", "executable": true },
            "cache": { "create": "directory" },
            "empty.txt": { "create": "file" }
        }
    })";

    auto result = parse_manifest_json(json, temp.path(), "build.json");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());

    const Manifest& m = result.manifest;
    CHECK(m.size() == 4);
    CHECK(m.build_file() == "Containerfile");

    const auto* render = m.find("Containerfile");
    REQUIRE(render != nullptr);
    const auto& action = std::get<RenderAction>(render->action);
    CHECK(action.source_path == temp.path() + "/Containerfile.j2");
    CHECK(action.context["use_env"] == true);
    CHECK(action.context["ros_packages"] == "ros-humble-desktop\n");

    const auto* copy = m.find("install.sh");
    REQUIRE(copy != nullptr);
    CHECK(copy->executable);
    CHECK(std::get<CopyAction>(copy->action).source_path == temp.path() + "/scripts/install.sh");

    CHECK(std::get<CreateEmptyAction>(m.find("cache")->action).kind == EmptyKind::Directory);
    CHECK(std::get<CreateEmptyAction>(m.find("empty.txt")->action).kind == EmptyKind::File);
    CHECK_FALSE(m.find("empty.txt")->executable);
}

TEST_CASE("entry context takes precedence over context files") {
    TempDir temp;
    temp.write("value.txt", "from file");

    std::string json = R"({
        "$schema": "ctxstage.manifest.v1",
        "context_files": { "value": "value.txt" },
        "entries": {
            "Dockerfile": { "render": "t.j2", "context": { "value": "from entry" } }
        }
    })";

    auto result = parse_manifest_json(json, temp.path());
    REQUIRE(result.ok);
    const auto& action = std::get<RenderAction>(result.manifest.find("Dockerfile")->action);
    CHECK(action.context["value"] == "from entry");
}

TEST_CASE("manifest parse errors") {
    TempDir temp;

    SUBCASE("invalid JSON") {
        auto r = parse_manifest_json("{not json", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("invalid JSON") != std::string::npos);
    }

    SUBCASE("missing schema") {
        auto r = parse_manifest_json(R"({"entries": {}})", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("$schema missing") != std::string::npos);
    }

    SUBCASE("wrong schema") {
        auto r = parse_manifest_json(R"({"$schema": "other.v1", "entries": {}})", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("$schema mismatch") != std::string::npos);
    }

    SUBCASE("no entries") {
        auto r = parse_manifest_json(R"({"$schema": "ctxstage.manifest.v1"})", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("entries") != std::string::npos);
    }

    SUBCASE("two actions in one entry") {
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "entries": { "a": { "copy": "x", "create": "file" } }
        })", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("exactly one of copy, render, create") != std::string::npos);
    }

    SUBCASE("null render context") {
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "entries": { "Dockerfile": { "render": "t.j2", "context": null } }
        })", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error == "Context for template rendering can't be null for element 'Dockerfile'");
    }

    SUBCASE("missing render context") {
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "entries": { "Dockerfile": { "render": "t.j2" } }
        })", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("can't be null") != std::string::npos);
    }

    SUBCASE("render context not an object") {
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "entries": { "Dockerfile": { "render": "t.j2", "context": [1, 2] } }
        })", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("must be an object") != std::string::npos);
    }

    SUBCASE("unknown create kind") {
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "entries": { "x": { "create": "socket" } }
        })", temp.path());
        CHECK_FALSE(r.ok);
    }

    SUBCASE("executable must be boolean") {
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "entries": { "x": { "create": "file", "executable": "yes" } }
        })", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("executable must be a boolean") != std::string::npos);
    }

    SUBCASE("missing context file") {
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "context_files": { "pkgs": "missing.txt" },
            "entries": { "x": { "create": "file" } }
        })", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("not found") != std::string::npos);
    }

    SUBCASE("blank context file") {
        temp.write("blank.txt", "  \n\n");
        auto r = parse_manifest_json(R"({
            "$schema": "ctxstage.manifest.v1",
            "context_files": { "pkgs": "blank.txt" },
            "entries": { "x": { "create": "file" } }
        })", temp.path());
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("is empty") != std::string::npos);
    }
}

TEST_CASE("unknown entry fields produce warnings") {
    TempDir temp;
    auto r = parse_manifest_json(R"({
        "$schema": "ctxstage.manifest.v1",
        "entries": { "x": { "create": "file", "mode": "0755" } }
    })", temp.path(), "m.json");
    REQUIRE(r.ok);
    REQUIRE(r.warnings.size() == 1);
    CHECK(r.warnings[0].find("unknown field 'mode'") != std::string::npos);
}

TEST_CASE("load_manifest_file resolves sources next to the manifest") {
    TempDir temp;
    fs::create_directories(temp.path() + "/conf");
    std::string path = temp.write("conf/build.json", R"({
        "$schema": "ctxstage.manifest.v1",
        "entries": { "entry.sh": { "copy": "entry.sh", "executable": true } }
    })");

    auto r = load_manifest_file(path);
    REQUIRE(r.ok);
    CHECK(std::get<CopyAction>(r.manifest.find("entry.sh")->action).source_path ==
          temp.path() + "/conf/entry.sh");
}

TEST_CASE("load_manifest_file fails for a missing file") {
    auto r = load_manifest_file("/nonexistent/ctxstage/build.json");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("does not exist") != std::string::npos);
}

// ============================================================================
// Command-line overrides
// ============================================================================

TEST_CASE("parse_key_value splits on the first equals sign") {
    KeyValue kv;
    REQUIRE(parse_key_value("ROS_DISTRO=humble", kv));
    CHECK(kv.key == "ROS_DISTRO");
    CHECK(kv.value == "humble");

    REQUIRE(parse_key_value("OPTS=a=b", kv));
    CHECK(kv.key == "OPTS");
    CHECK(kv.value == "a=b");

    REQUIRE(parse_key_value("EMPTY=", kv));
    CHECK(kv.value.empty());

    CHECK_FALSE(parse_key_value("novalue", kv));
    CHECK_FALSE(parse_key_value("=value", kv));
}

TEST_CASE("apply_file_override adds or replaces copy entries") {
    TempDir temp;
    std::string script = temp.write("entrypoint.sh", "#!/bin/sh\n");

    Manifest m;
    m.put(create_entry("entrypoint.sh", EmptyKind::File));

    auto r = apply_file_override(m, "entrypoint.sh=" + script, true);
    REQUIRE(r.ok);

    const auto* entry = m.find("entrypoint.sh");
    REQUIRE(entry != nullptr);
    CHECK(entry->executable);
    CHECK(std::get<CopyAction>(entry->action).source_path == script);
}

TEST_CASE("apply_file_override rejects missing or empty files") {
    TempDir temp;
    std::string empty = temp.write("empty.txt", "");
    Manifest m;

    SUBCASE("missing") {
        auto r = apply_file_override(m, "a=" + temp.path() + "/nope", false);
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("not found or empty") != std::string::npos);
    }
    SUBCASE("empty") {
        auto r = apply_file_override(m, "a=" + empty, false);
        CHECK_FALSE(r.ok);
    }
    SUBCASE("directory") {
        auto r = apply_file_override(m, "a=" + temp.path(), false);
        CHECK_FALSE(r.ok);
    }
    SUBCASE("malformed") {
        auto r = apply_file_override(m, "no-equals", false);
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("expected DEST=PATH") != std::string::npos);
    }

    CHECK(m.empty());
}
