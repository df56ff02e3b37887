#include <doctest/doctest.h>
#include <lode/install_record.hpp>
#include <lode/platform.hpp>

#include "test_helpers.hpp"

using namespace lode;
using lode::test::TempDir;

namespace {

const char* VALID_RECORD = R"({
    "$schema": "lode.installed.v1",
    "spec": {"name": "foo", "version": "1.0.0", "autorequire": "foo"},
    "provenance": {
        "installed_at": "2024-01-01T00:00:00Z",
        "source": "/tmp/foo-1.0.0.lode",
        "cache_file": "foo-1.0.0.lode",
        "package_hash": "sha256:abc"
    },
    "stubs": {
        "bin_stubs": ["/opt/lode/bin/foo"],
        "library_stub": "/opt/lode/site_lib/foo.rb"
    }
})";

} // namespace

TEST_CASE("installed record valid required fields") {
    auto result = parse_installed_record(VALID_RECORD, "/opt/lode/specifications/foo-1.0.0.json");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    CHECK(result.record.spec.full_name() == "foo-1.0.0");
    CHECK(result.record.provenance.installed_at == "2024-01-01T00:00:00Z");
    CHECK(result.record.provenance.cache_file == "foo-1.0.0.lode");
    CHECK(result.record.provenance.package_hash == "sha256:abc");
    CHECK(result.record.stubs.bin_stubs == std::vector<std::string>{"/opt/lode/bin/foo"});
    CHECK(result.record.stubs.library_stub == "/opt/lode/site_lib/foo.rb");
    CHECK(result.record.stubs.library_stub_requested);
    CHECK(result.record.source_path == "/opt/lode/specifications/foo-1.0.0.json");
}

TEST_CASE("installed record requires schema and spec") {
    CHECK(parse_installed_record(R"({"spec": {"name": "a", "version": "1"}})").error == "$schema missing");
    CHECK(parse_installed_record(R"({"$schema": "lode.installed.v1"})").error == "spec section missing");
    CHECK_FALSE(parse_installed_record(R"({"$schema": "lode.installed.v2", "spec": {}})").ok);

    auto bad_spec = parse_installed_record(R"({"$schema": "lode.installed.v1", "spec": {"name": "a"}})");
    CHECK_FALSE(bad_spec.ok);
    CHECK(bad_spec.error == "spec: version missing");
}

TEST_CASE("installed record provenance MAY be absent") {
    auto result = parse_installed_record(
        R"({"$schema": "lode.installed.v1", "spec": {"name": "a", "version": "1"}})");
    REQUIRE(result.ok);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0] == "provenance_missing");
    CHECK(result.record.stubs.bin_stubs.empty());
    CHECK(result.record.stubs.library_stub.empty());
}

TEST_CASE("installed record null library stub reads as none") {
    auto result = parse_installed_record(R"({
        "$schema": "lode.installed.v1",
        "spec": {"name": "a", "version": "1"},
        "provenance": {},
        "stubs": {"bin_stubs": [], "library_stub": null}
    })");
    REQUIRE(result.ok);
    CHECK(result.record.stubs.library_stub.empty());
    CHECK_FALSE(result.record.stubs.library_stub_requested);
}

TEST_CASE("installed record keeps a requested library stub that was not written") {
    auto result = parse_installed_record(R"({
        "$schema": "lode.installed.v1",
        "spec": {"name": "a", "version": "1", "autorequire": "shared"},
        "provenance": {},
        "stubs": {"bin_stubs": [], "library_stub": null, "library_stub_requested": true}
    })");
    REQUIRE(result.ok);
    CHECK(result.record.stubs.library_stub.empty());
    CHECK(result.record.stubs.library_stub_requested);

    auto again = parse_installed_record(serialize_installed_record(result.record));
    REQUIRE(again.ok);
    CHECK(again.record.stubs.library_stub_requested);
}

TEST_CASE("serialize_installed_record round trips") {
    auto parsed = parse_installed_record(VALID_RECORD);
    REQUIRE(parsed.ok);

    auto again = parse_installed_record(serialize_installed_record(parsed.record));
    REQUIRE(again.ok);
    CHECK(again.record.spec.full_name() == "foo-1.0.0");
    CHECK(again.record.provenance.source == "/tmp/foo-1.0.0.lode");
    CHECK(again.record.stubs.library_stub == "/opt/lode/site_lib/foo.rb");

    InstalledPackageRecord empty;
    empty.spec.name = "x";
    empty.spec.version = "1";
    auto text = serialize_installed_record(empty);
    CHECK(text.find("\"library_stub\": null") != std::string::npos);
}

TEST_CASE("descriptor_path names the file after full_name") {
    CHECK(descriptor_path("/opt/lode", "foo-1.0.0") == "/opt/lode/specifications/foo-1.0.0.json");
}

TEST_CASE("load_installed_record fills installation fields") {
    TempDir dir;
    REQUIRE(create_directories(dir.sub("specifications")));
    std::string path = descriptor_path(dir.path(), "foo-1.0.0");
    REQUIRE(atomic_write_file(path, std::string(VALID_RECORD)).ok);

    auto result = load_installed_record(dir.path(), path);
    REQUIRE(result.ok);
    CHECK(result.record.spec.installation_path == dir.path());
    CHECK(result.record.spec.loaded_from == path);

    auto missing = load_installed_record(dir.path(), dir.sub("specifications/none.json"));
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.find("failed to read") == 0);
}
