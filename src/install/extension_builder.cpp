#include "lode/extension_builder.hpp"
#include "lode/platform.hpp"

#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

namespace lode {

namespace {

size_t skip_spaces(const std::string& s, size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    return pos;
}

// Matches "<var>\s*=\s*\$.*" anchored at the start of the line
bool is_variable_assignment(const std::string& line, const std::string& var) {
    if (line.compare(0, var.size(), var) != 0) return false;
    size_t pos = skip_spaces(line, var.size());
    if (pos >= line.size() || line[pos] != '=') return false;
    pos = skip_spaces(line, pos + 1);
    return pos < line.size() && line[pos] == '$';
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

std::string dirname_of(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

std::string basename_of(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

ExtensionBuildOptions make_extension_build_options(const HostConfig& config,
                                                   std::vector<std::string> build_args) {
    ExtensionBuildOptions options;
    options.interpreter = config.interpreter.path;
    options.make_program = resolve_make_program(config);
    options.install_dir_variables = config.build.install_dir_variables;
    options.build_args = std::move(build_args);
    return options;
}

std::string patch_makefile(const std::string& makefile,
                           const std::vector<std::string>& variables,
                           const std::string& dest_path) {
    std::string out;
    out.reserve(makefile.size());

    size_t start = 0;
    while (start < makefile.size()) {
        size_t end = makefile.find('\n', start);
        bool has_newline = end != std::string::npos;
        std::string line = makefile.substr(start, has_newline ? end - start : std::string::npos);

        std::string cr;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
            cr = "\r";
        }

        for (const auto& var : variables) {
            if (is_variable_assignment(line, var)) {
                line = var + " = " + dest_path;
                break;
            }
        }

        out += line;
        out += cr;
        if (has_newline) out += '\n';
        start = has_newline ? end + 1 : makefile.size();
    }

    return out;
}

ExtensionBuilder::ExtensionBuilder(ExtensionBuildOptions options, ProcessRunner& runner)
    : options_(std::move(options)), runner_(runner) {}

std::vector<ExtensionBuildReport> ExtensionBuilder::build(const std::string& package_dir,
                                                          const Specification& spec) {
    std::vector<ExtensionBuildReport> reports;
    if (spec.extensions.empty()) {
        return reports;
    }

    std::string first_require_path = spec.require_paths.empty() ? "lib" : spec.require_paths.front();
    std::string dest_path = join_path(package_dir, first_require_path);

    for (const auto& extension : spec.extensions) {
        reports.push_back(build_one(package_dir, dest_path, extension));
    }
    return reports;
}

ExtensionBuildReport ExtensionBuilder::build_one(const std::string& package_dir,
                                                 const std::string& dest_path,
                                                 const std::string& extension) {
    ExtensionBuildReport report;
    report.extension = extension;

    std::string ext_dir = dirname_of(extension).empty()
                              ? package_dir
                              : join_path(package_dir, dirname_of(extension));
    report.log_path = join_path(ext_dir, EXTENSION_BUILD_LOG);

    std::vector<std::string> log;
    auto fail = [&](const std::string& reason) {
        report.ok = false;
        report.error_kind = PackageError::EXTENSION_BUILD;
        report.error = reason;
    };

    // Run a command in the extension dir, recording it and its output
    auto invoke = [&](std::vector<std::string> argv) -> ProcessResult {
        std::string cmd = format_command(argv);
        report.commands.push_back(cmd);
        log.push_back(cmd);

        auto result = runner_.run({std::move(argv), ext_dir});
        log.push_back(result.ok ? result.output : result.error);
        return result;
    };

    auto make_step = [&](std::vector<std::string> argv) -> bool {
        std::string cmd = format_command(argv);
        auto result = invoke(std::move(argv));
        if (!result.ok) {
            fail("failed to run '" + cmd + "': " + result.error + "; see " + report.log_path);
            return false;
        }
        if (result.exit_code != 0) {
            fail("'" + cmd + "' exited with status " + std::to_string(result.exit_code) +
                 "; see " + report.log_path);
            return false;
        }
        return true;
    };

    if (!is_directory(ext_dir)) {
        fail("extension directory not found: " + ext_dir);
        return report;
    }

    spdlog::debug("building extension {} in {}", extension, ext_dir);

    // A Makefile left from an earlier build must not pass for this one's output
    std::string makefile_path = join_path(ext_dir, "Makefile");
    if (path_exists(makefile_path) && !remove_file(makefile_path)) {
        fail("failed to remove stale Makefile: " + makefile_path);
        return report;
    }

    std::vector<std::string> script_argv = {options_.interpreter, basename_of(extension)};
    script_argv.insert(script_argv.end(), options_.build_args.begin(), options_.build_args.end());

    // The script's exit status is not checked: a produced Makefile is what counts
    auto script = invoke(script_argv);

    auto makefile = script.ok ? read_text_file(makefile_path) : std::nullopt;

    if (!script.ok) {
        fail("failed to run '" + format_command(script_argv) + "': " + script.error +
             "; see " + report.log_path);
    } else if (!makefile) {
        fail("failed to build native extension; see " + report.log_path);
    } else {
        auto patched = patch_makefile(*makefile, options_.install_dir_variables, dest_path);
        if (patched != *makefile) {
            auto write = atomic_write_file(makefile_path, patched);
            if (!write.ok) {
                log.push_back("failed to rewrite Makefile: " + write.error);
            }
        }

        std::vector<std::string> overrides;
        for (const auto& var : options_.install_dir_variables) {
            overrides.push_back(var + "=" + dest_path);
        }

        auto make_words = split_words(options_.make_program);
        if (make_words.empty()) make_words.push_back(default_make_program());

        std::vector<std::string> make_argv = make_words;
        make_argv.insert(make_argv.end(), overrides.begin(), overrides.end());

        std::vector<std::string> install_argv = make_words;
        install_argv.push_back("install");
        install_argv.insert(install_argv.end(), overrides.begin(), overrides.end());

        if (make_step(make_argv) && make_step(install_argv)) {
            report.ok = true;
        }
    }

    std::string log_text;
    for (const auto& entry : log) {
        log_text += entry;
        if (log_text.empty() || log_text.back() != '\n') log_text += '\n';
    }
    auto write = write_file_with_mode(report.log_path, log_text, 0644);
    if (!write.ok) {
        spdlog::warn("could not write build log {}: {}", report.log_path, write.error);
    }

    if (report.ok) {
        spdlog::debug("extension {} built", extension);
    } else {
        spdlog::warn("extension {} failed: {}", extension, report.error);
    }
    return report;
}

} // namespace lode
