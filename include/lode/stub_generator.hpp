#pragma once

#include "lode/host_config.hpp"

#include <string>

namespace lode {

// First comment line of every file lode generates outside a package dir
constexpr const char* GENERATED_STUB_MARKER = "# This file was generated by lode.";

/**
 * Renders launcher and library-stub text.
 *
 * Pure text generation: callers write the result with the right mode
 * (0755 for launchers, 0644 for library stubs).
 */
class StubGenerator {
public:
    StubGenerator(std::string interpreter_path, std::string loader);
    explicit StubGenerator(const HostConfig& config);

    // Launcher that activates <name> at <version> and loads <filename>
    std::string app_script_text(const std::string& name,
                                const std::string& version,
                                const std::string& filename) const;

    // Library stub that activates the newest installed <name>
    std::string library_stub_text(const std::string& name) const;

    // True when `text` carries the generated-file marker
    static bool is_generated_stub(const std::string& text);

    const std::string& interpreter_path() const { return interpreter_path_; }
    const std::string& loader() const { return loader_; }

private:
    std::string interpreter_path_;
    std::string loader_;
};

} // namespace lode
