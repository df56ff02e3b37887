#include <doctest/doctest.h>
#include <lode/archive.hpp>
#include <lode/install_record.hpp>
#include <lode/installer.hpp>
#include <lode/package_index.hpp>
#include <lode/platform.hpp>
#include <lode/stub_generator.hpp>

#include "test_helpers.hpp"

#include <filesystem>

using namespace lode;
using lode::test::FixedResolver;
using lode::test::RecordingProcessRunner;
using lode::test::TempDir;
using lode::test::file_entry;
using lode::test::make_spec;
using lode::test::test_config;
using lode::test::tree_listing;

namespace {

// Write a built archive next to (not inside) the install root
std::string write_archive(const TempDir& dir, const Specification& spec,
                          const std::vector<FileEntry>& files) {
    auto built = build_package_archive(spec, files);
    REQUIRE(built.ok);
    std::string path = dir.sub("incoming/" + archive_file_name(spec));
    REQUIRE(atomic_write_file(path, built.archive_data).ok);
    return path;
}

std::vector<FileEntry> sample_files() {
    return {
        file_entry("lib/sample.rb", "module Sample; end\n"),
        file_entry("bin/sample", "#!/usr/bin/env ruby\nputs 'hi'\n", 0755),
        file_entry("README", "read me\n", 0600),
    };
}

InstallOptions options_for(const std::string& install_dir) {
    InstallOptions options;
    options.install_dir = install_dir;
    return options;
}

} // namespace

// ============================================================================
// Layout
// ============================================================================

TEST_CASE("install lays out package dir, descriptor and cache") {
    TempDir dir;
    std::string D = dir.sub("root");
    auto spec = make_spec("sample", "1.0.0");
    std::string archive = write_archive(dir, spec, sample_files());

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(archive, options_for(D));
    REQUIRE(result.ok);
    CHECK_FALSE(result.error_kind);
    CHECK(result.message == "Successfully installed sample version 1.0.0");
    CHECK(result.warnings.empty());

    std::string pkg = join_path(D, "gems/sample-1.0.0");
    CHECK(result.package_dir == pkg);

    SUBCASE("package dir holds exactly the archive entries with their modes") {
        CHECK(tree_listing(pkg) ==
              std::vector<std::string>{"README", "bin", "bin/sample", "lib", "lib/sample.rb"});
        CHECK(get_file_mode(join_path(pkg, "bin/sample")) == 0755u);
        CHECK(get_file_mode(join_path(pkg, "lib/sample.rb")) == 0644u);
        CHECK(get_file_mode(join_path(pkg, "README")) == 0600u);
        CHECK(read_text_file(join_path(pkg, "lib/sample.rb")) == std::string("module Sample; end\n"));
    }

    SUBCASE("descriptor records the package specification and provenance") {
        CHECK(result.descriptor_path == join_path(D, "specifications/sample-1.0.0.json"));
        auto loaded = load_installed_record(D, result.descriptor_path);
        REQUIRE(loaded.ok);
        CHECK(loaded.record.spec.full_name() == "sample-1.0.0");
        CHECK(loaded.record.provenance.source == absolute_path(archive));
        CHECK(loaded.record.provenance.cache_file == "sample-1.0.0.lode");
        CHECK(loaded.record.provenance.package_hash.rfind("sha256:", 0) == 0);
        CHECK_FALSE(loaded.record.provenance.installed_at.empty());

        CHECK(result.spec.installation_path == absolute_path(D));
        CHECK(result.spec.loaded_from == result.descriptor_path);
    }

    SUBCASE("cache is byte-identical to the source archive") {
        CHECK(result.cache_path == join_path(D, "cache/sample-1.0.0.lode"));
        auto cached = read_file_bytes(result.cache_path);
        auto original = read_file_bytes(archive);
        REQUIRE(cached);
        REQUIRE(original);
        CHECK(*cached == *original);
    }

    SUBCASE("the installed package is visible to the index") {
        InstalledPackageIndex index(D);
        auto found = index.search("sample");
        REQUIRE(found.size() == 1);
        CHECK(found[0].version == "1.0.0");
    }

    CHECK(path_exists(join_path(D, "doc")));
}

TEST_CASE("install from an in-memory archive rebuilds the cache entry") {
    TempDir dir;
    std::string D = dir.sub("root");

    PackageArchive archive;
    archive.spec = make_spec("mem", "0.1");
    archive.files = {file_entry("lib/mem.rb", "x\n")};

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(archive, options_for(D));
    REQUIRE(result.ok);
    CHECK(result.cache_path == join_path(D, "cache/mem-0.1.lode"));

    auto cached = read_file_bytes(result.cache_path);
    REQUIRE(cached);
    auto reread = read_package_archive(*cached);
    REQUIRE(reread.ok);
    CHECK(reread.archive.spec.full_name() == "mem-0.1");
    REQUIRE(reread.archive.files.size() == 1);
    CHECK(reread.archive.files[0].path == "lib/mem.rb");
}

TEST_CASE("an existing cache entry is left alone") {
    TempDir dir;
    std::string D = dir.sub("root");
    auto spec = make_spec("sample", "1.0.0");
    std::string archive = write_archive(dir, spec, sample_files());

    REQUIRE(atomic_write_file(join_path(D, "cache/sample-1.0.0.lode"), std::string("older")).ok);

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(archive, options_for(D));
    REQUIRE(result.ok);
    CHECK(read_text_file(result.cache_path) == std::string("older"));
}

TEST_CASE("install rejects a file that is not an archive") {
    TempDir dir;
    std::string D = dir.sub("root");
    REQUIRE(atomic_write_file(dir.sub("junk.lode"), std::string("not gzip")).ok);

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(dir.sub("junk.lode"), options_for(D));
    CHECK_FALSE(result.ok);
    REQUIRE(result.error_kind);
    CHECK(*result.error_kind == PackageError::ARCHIVE_INVALID);
    CHECK_FALSE(path_exists(D));

    auto missing = installer.install(dir.sub("absent.lode"), options_for(D));
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.find("failed to open archive") == 0);
}

// ============================================================================
// Dependencies
// ============================================================================

TEST_CASE("an unsatisfied dependency fails and leaves the install root unchanged") {
    TempDir dir;
    std::string D = dir.sub("root");
    REQUIRE(create_directories(join_path(D, "gems")));
    REQUIRE(atomic_write_file(join_path(D, "notes.txt"), std::string("keep")).ok);

    auto spec = make_spec("app", "2.0.0");
    Dependency dep;
    dep.name = "q";
    dep.requirement = ">= 1.0";
    spec.dependencies = {dep};
    std::string archive = write_archive(dir, spec, sample_files());

    auto before = tree_listing(D);

    FixedResolver resolver(false);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(archive, options_for(D));
    CHECK_FALSE(result.ok);
    REQUIRE(result.error_kind);
    CHECK(*result.error_kind == PackageError::MISSING_DEPENDENCY);
    CHECK(result.missing_dependencies == std::vector<std::string>{"q (>= 1.0)"});
    CHECK(result.error == "app-2.0.0 requires q (>= 1.0)");
    CHECK(resolver.asked == std::vector<std::string>{"q"});

    CHECK(tree_listing(D) == before);
    CHECK(runner.calls.empty());

    SUBCASE("force installs regardless") {
        auto options = options_for(D);
        options.force = true;
        auto forced = installer.install(archive, options);
        CHECK(forced.ok);
        CHECK(path_exists(join_path(D, "specifications/app-2.0.0.json")));
    }
}

TEST_CASE("dependency preflight consults installed packages") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto q = make_spec("q", "1.2.0");
    auto p = make_spec("p", "1.0.0");
    Dependency dep;
    dep.name = "q";
    dep.requirement = "~> 1.0";
    p.dependencies = {dep};

    InstalledPackageIndex index(D);
    IndexDependencyResolver resolver(index);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    CHECK_FALSE(installer.install(write_archive(dir, p, {}), options_for(D)).ok);
    REQUIRE(installer.install(write_archive(dir, q, {}), options_for(D)).ok);
    CHECK(installer.install(write_archive(dir, p, {}), options_for(D)).ok);
}

// ============================================================================
// Extensions
// ============================================================================

TEST_CASE("a package without extensions spawns no process") {
    TempDir dir;
    std::string D = dir.sub("root");

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(write_archive(dir, make_spec("sample", "1.0.0"), sample_files()),
                                    options_for(D));
    REQUIRE(result.ok);
    CHECK(result.extension_reports.empty());
    CHECK(runner.calls.empty());
}

TEST_CASE("an extension that produces no Makefile is reported but install succeeds") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("native", "1.0.0");
    spec.extensions = {"ext/native/extconf.rb"};
    auto files = sample_files();
    files.push_back(file_entry("ext/native/extconf.rb", "exit 1\n"));

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto options = options_for(D);
    options.build_args = {"--with-foo"};
    auto result = installer.install(write_archive(dir, spec, files), options);

    REQUIRE(result.ok);
    REQUIRE(result.extension_reports.size() == 1);
    const auto& report = result.extension_reports[0];
    CHECK_FALSE(report.ok);
    REQUIRE(report.error_kind);
    CHECK(*report.error_kind == PackageError::EXTENSION_BUILD);

    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0].argv ==
          std::vector<std::string>{"/usr/bin/ruby", "extconf.rb", "--with-foo"});
    CHECK(runner.calls[0].cwd == join_path(result.package_dir, "ext/native"));

    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].key == "extension_build_failed");
    CHECK_FALSE(result.warning_errors);

    CHECK(path_exists(result.descriptor_path));
    CHECK(path_exists(result.cache_path));
    CHECK(path_exists(join_path(result.package_dir, "ext/native/lode_make.out")));
}

TEST_CASE("extension_build_failed can be escalated by the host config") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("native", "1.0.0");
    spec.extensions = {"extconf.rb"};

    auto config = test_config(D);
    config.warnings["extension_build_failed"] = WarningAction::Error;

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(config, resolver, runner);

    auto result = installer.install(write_archive(dir, spec, {file_entry("extconf.rb", "")}),
                                    options_for(D));
    CHECK(result.ok);
    CHECK(result.warning_errors);
}

TEST_CASE("a successful extension build installs into the first require path") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("native", "1.0.0");
    spec.extensions = {"ext/extconf.rb"};

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    runner.handler = [](const ProcessSpec& call) {
        ProcessResult result;
        result.ok = true;
        result.exit_code = 0;
        if (call.argv[1] == "extconf.rb") {
            atomic_write_file(join_path(call.cwd, "Makefile"), std::string("RUBYARCHDIR = $(x)\n"));
        }
        return result;
    };
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(write_archive(dir, spec, {file_entry("ext/extconf.rb", "")}),
                                    options_for(D));
    REQUIRE(result.ok);
    REQUIRE(result.extension_reports.size() == 1);
    CHECK(result.extension_reports[0].ok);
    CHECK(result.warnings.empty());

    REQUIRE(runner.calls.size() == 3);
    std::string dest = join_path(result.package_dir, "lib");
    CHECK(runner.calls[1].argv.back() == "RUBYLIBDIR=" + dest);

    auto makefile = read_text_file(join_path(result.package_dir, "ext/Makefile"));
    REQUIRE(makefile);
    CHECK(*makefile == "RUBYARCHDIR = " + dest + "\n");
}

// ============================================================================
// Stubs
// ============================================================================

TEST_CASE("launchers are written for each executable") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("sample", "1.0.0");
    spec.executables = {"sample"};

    auto config = test_config(D);
    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(config, resolver, runner);

    auto result = installer.install(write_archive(dir, spec, sample_files()), options_for(D));
    REQUIRE(result.ok);

    std::string launcher = join_path(config.interpreter.bindir, "sample");
    CHECK(result.bin_stubs == std::vector<std::string>{launcher});
    CHECK(get_file_mode(launcher) == 0755u);

    StubGenerator generator(config);
    CHECK(read_text_file(launcher) ==
          generator.app_script_text("sample", "1.0.0", join_path(result.package_dir, "bin/sample")));

    auto loaded = load_installed_record(D, result.descriptor_path);
    REQUIRE(loaded.ok);
    CHECK(loaded.record.stubs.bin_stubs == std::vector<std::string>{launcher});
}

TEST_CASE("library stub is written for autorequire") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("sources", "0.0.1");
    spec.autorequire = "sources";

    auto config = test_config(D);
    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(config, resolver, runner);

    std::string stub = join_path(config.interpreter.sitelibdir, "sources.rb");

    SUBCASE("written with mode 0644 and recorded") {
        auto result = installer.install(write_archive(dir, spec, sample_files()), options_for(D));
        REQUIRE(result.ok);
        CHECK(result.library_stub == stub);
        CHECK(get_file_mode(stub) == 0644u);
        CHECK(read_text_file(stub) == StubGenerator(config).library_stub_text("sources"));

        auto loaded = load_installed_record(D, result.descriptor_path);
        REQUIRE(loaded.ok);
        CHECK(loaded.record.stubs.library_stub == stub);
    }

    SUBCASE("an existing file is kept and reported") {
        REQUIRE(atomic_write_file(stub, std::string("hand written\n")).ok);

        auto result = installer.install(write_archive(dir, spec, sample_files()), options_for(D));
        REQUIRE(result.ok);
        CHECK(result.library_stub.empty());
        CHECK(read_text_file(stub) == std::string("hand written\n"));
        REQUIRE(result.warnings.size() == 1);
        CHECK(result.warnings[0].key == "library_stub_exists");
        CHECK(result.warnings[0].fields.at("path") == stub);

        auto loaded = load_installed_record(D, result.descriptor_path);
        REQUIRE(loaded.ok);
        CHECK(loaded.record.stubs.library_stub.empty());
        CHECK(loaded.record.stubs.library_stub_requested);
    }

    SUBCASE("skipped when stubs are turned off") {
        auto options = options_for(D);
        options.install_stub = false;
        auto result = installer.install(write_archive(dir, spec, sample_files()), options);
        REQUIRE(result.ok);
        CHECK(result.library_stub.empty());
        CHECK_FALSE(path_exists(stub));

        auto loaded = load_installed_record(D, result.descriptor_path);
        REQUIRE(loaded.ok);
        CHECK_FALSE(loaded.record.stubs.library_stub_requested);
    }
}

TEST_CASE("nested autorequire names get their directories created") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("netthing", "1.0");
    spec.autorequire = "net/thing";

    auto config = test_config(D);
    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(config, resolver, runner);

    auto result = installer.install(write_archive(dir, spec, {}), options_for(D));
    REQUIRE(result.ok);
    CHECK(result.library_stub == join_path(config.interpreter.sitelibdir, "net/thing.rb"));
    CHECK(path_exists(result.library_stub));
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("an unsafe entry aborts extraction without leaving a package dir") {
    TempDir dir;
    std::string D = dir.sub("root");

    PackageArchive archive;
    archive.spec = make_spec("evil", "1.0");
    archive.files = {file_entry("lib/ok.rb", "x"), file_entry("../../escaped.rb", "boom")};

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto cwd = std::filesystem::current_path();
    auto result = installer.install(archive, options_for(D));

    CHECK_FALSE(result.ok);
    REQUIRE(result.error_kind);
    CHECK(*result.error_kind == PackageError::EXTRACTION_IO);
    CHECK_FALSE(path_exists(join_path(D, "gems/evil-1.0")));
    CHECK_FALSE(path_exists(join_path(D, "escaped.rb")));
    CHECK_FALSE(path_exists(dir.sub("escaped.rb")));
    CHECK_FALSE(path_exists(join_path(D, "specifications/evil-1.0.json")));
    CHECK(std::filesystem::current_path() == cwd);
}

TEST_CASE("a descriptor that cannot be written takes the install back") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("sample", "1.0.0");
    spec.executables = {"sample"};
    spec.autorequire = "sample";

    auto config = test_config(D);
    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(config, resolver, runner);

    // A directory in the descriptor's place makes the final rename fail
    std::string descriptor = join_path(D, "specifications/sample-1.0.0.json");
    REQUIRE(create_directories(descriptor));

    auto result = installer.install(write_archive(dir, spec, sample_files()), options_for(D));
    CHECK_FALSE(result.ok);
    REQUIRE(result.error_kind);
    CHECK(*result.error_kind == PackageError::PERSISTENCE_IO);

    CHECK_FALSE(path_exists(join_path(D, "gems/sample-1.0.0")));
    CHECK_FALSE(path_exists(join_path(config.interpreter.bindir, "sample")));
    CHECK_FALSE(path_exists(join_path(config.interpreter.sitelibdir, "sample.rb")));
    CHECK_FALSE(path_exists(join_path(D, "cache/sample-1.0.0.lode")));
    CHECK(result.bin_stubs.empty());
    CHECK(result.library_stub.empty());
}

TEST_CASE("a failed descriptor write keeps a launcher that was already there") {
    TempDir dir;
    std::string D = dir.sub("root");

    auto spec = make_spec("sample", "1.0.0");
    spec.executables = {"sample"};

    auto config = test_config(D);
    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(config, resolver, runner);

    std::string launcher = join_path(config.interpreter.bindir, "sample");
    REQUIRE(atomic_write_file(launcher, std::string("#!/bin/sh\n")).ok);
    REQUIRE(create_directories(join_path(D, "specifications/sample-1.0.0.json")));

    auto result = installer.install(write_archive(dir, spec, sample_files()), options_for(D));
    CHECK_FALSE(result.ok);
    CHECK(path_exists(launcher));
}

TEST_CASE("an invalid specification is rejected before anything is written") {
    TempDir dir;
    std::string D = dir.sub("root");

    PackageArchive archive;
    archive.spec = make_spec("bad", "1.0");
    archive.spec.extensions = {"../outside/extconf.rb"};

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    auto result = installer.install(archive, options_for(D));
    CHECK_FALSE(result.ok);
    REQUIRE(result.error_kind);
    CHECK(*result.error_kind == PackageError::ARCHIVE_INVALID);
    CHECK_FALSE(path_exists(D));
}

TEST_CASE("reinstalling the same version overwrites files in place") {
    TempDir dir;
    std::string D = dir.sub("root");
    auto spec = make_spec("sample", "1.0.0");

    FixedResolver resolver(true);
    RecordingProcessRunner runner;
    Installer installer(test_config(D), resolver, runner);

    REQUIRE(installer.install(write_archive(dir, spec, sample_files()), options_for(D)).ok);

    auto files = sample_files();
    files[0] = file_entry("lib/sample.rb", "module Sample; VERSION = 2; end\n");
    PackageArchive archive;
    archive.spec = spec;
    archive.files = files;
    auto again = installer.install(archive, options_for(D));
    REQUIRE(again.ok);
    CHECK(read_text_file(join_path(again.package_dir, "lib/sample.rb")) ==
          std::string("module Sample; VERSION = 2; end\n"));

    InstalledPackageIndex index(D);
    CHECK(index.search("sample").size() == 1);
}
