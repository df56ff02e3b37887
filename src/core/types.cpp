#include "lode/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace lode {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);
    
    if (lower == "library_stub_exists") return Warning::library_stub_exists;
    if (lower == "library_stub_unwritable") return Warning::library_stub_unwritable;
    if (lower == "bin_stub_unwritable") return Warning::bin_stub_unwritable;
    if (lower == "extension_build_failed") return Warning::extension_build_failed;
    if (lower == "cache_copy_failed") return Warning::cache_copy_failed;
    if (lower == "cache_remove_failed") return Warning::cache_remove_failed;
    if (lower == "stub_remove_failed") return Warning::stub_remove_failed;
    if (lower == "doc_remove_failed") return Warning::doc_remove_failed;
    if (lower == "invalid_descriptor") return Warning::invalid_descriptor;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;
    
    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace lode
