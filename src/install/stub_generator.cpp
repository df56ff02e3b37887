#include "lode/stub_generator.hpp"

#include <sstream>

namespace lode {

StubGenerator::StubGenerator(std::string interpreter_path, std::string loader)
    : interpreter_path_(std::move(interpreter_path)), loader_(std::move(loader)) {}

StubGenerator::StubGenerator(const HostConfig& config)
    : StubGenerator(config.interpreter.path, config.interpreter.loader) {}

std::string StubGenerator::app_script_text(const std::string& name,
                                           const std::string& version,
                                           const std::string& filename) const {
    std::ostringstream out;
    out << "#!" << interpreter_path_ << "\n"
        << "#\n"
        << GENERATED_STUB_MARKER << "\n"
        << "#\n"
        << "# The application '" << name << "' is installed as part of a package, and\n"
        << "# this file is here to facilitate running it.\n"
        << "#\n"
        << "\n"
        << "require '" << loader_ << "'\n"
        << "require_gem '" << name << "', \"" << version << "\"\n"
        << "load '" << filename << "'\n";
    return out.str();
}

std::string StubGenerator::library_stub_text(const std::string& name) const {
    std::ostringstream out;
    out << "#\n"
        << GENERATED_STUB_MARKER << "\n"
        << "#\n"
        << "# The library '" << name << "' is installed as part of a package, and\n"
        << "# this file is here so you can 'require' it easily (i.e.\n"
        << "# without having to know it's a package).\n"
        << "#\n"
        << "\n"
        << "require '" << loader_ << "'\n"
        << "require_gem '" << name << "'\n";
    return out.str();
}

bool StubGenerator::is_generated_stub(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    // The marker sits in the leading comment block
    for (int i = 0; i < 5 && std::getline(in, line); ++i) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == GENERATED_STUB_MARKER) return true;
    }
    return false;
}

} // namespace lode
