#include "lode/install_record.hpp"
#include "lode/platform.hpp"
#include "lode/types.hpp"

#include <nlohmann/json.hpp>
#include <cctype>

namespace lode {

namespace {

constexpr const char* RECORD_SCHEMA = "lode.installed.v1";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

InstalledRecordParseResult parse_installed_record(const std::string& json_str,
                                                  const std::string& source_path) {
    InstalledRecordParseResult result;
    result.record.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.record.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.record.schema != RECORD_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + RECORD_SCHEMA;
            return result;
        }

        // "spec" section (REQUIRED)
        if (!j.contains("spec")) {
            result.error = "spec section missing";
            return result;
        }
        auto spec_result = parse_specification_json(j["spec"]);
        if (!spec_result.ok) {
            result.error = "spec: " + spec_result.error;
            return result;
        }
        result.record.spec = std::move(spec_result.spec);

        // "provenance" section
        if (j.contains("provenance") && j["provenance"].is_object()) {
            const auto& prov = j["provenance"];
            if (auto dt = get_string(prov, "installed_at")) {
                result.record.provenance.installed_at = *dt;
            }
            if (auto src = get_string(prov, "source")) {
                result.record.provenance.source = *src;
            }
            if (auto cache = get_string(prov, "cache_file")) {
                result.record.provenance.cache_file = *cache;
            }
            if (auto h = get_string(prov, "package_hash")) {
                result.record.provenance.package_hash = *h;
            }
        } else {
            result.warnings.push_back("provenance_missing");
        }

        // "stubs" section
        if (j.contains("stubs") && j["stubs"].is_object()) {
            const auto& stubs = j["stubs"];
            if (stubs.contains("bin_stubs") && stubs["bin_stubs"].is_array()) {
                for (const auto& elem : stubs["bin_stubs"]) {
                    if (elem.is_string()) {
                        result.record.stubs.bin_stubs.push_back(elem.get<std::string>());
                    }
                }
            }
            if (auto lib = get_string(stubs, "library_stub")) {
                result.record.stubs.library_stub = *lib;
            }
            if (stubs.contains("library_stub_requested") && stubs["library_stub_requested"].is_boolean()) {
                result.record.stubs.library_stub_requested = stubs["library_stub_requested"].get<bool>();
            } else {
                result.record.stubs.library_stub_requested = !result.record.stubs.library_stub.empty();
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

std::string serialize_installed_record(const InstalledPackageRecord& record) {
    nlohmann::json j;
    j["$schema"] = RECORD_SCHEMA;
    j["spec"] = specification_to_json(record.spec);

    j["provenance"]["installed_at"] = record.provenance.installed_at;
    j["provenance"]["source"] = record.provenance.source;
    j["provenance"]["cache_file"] = record.provenance.cache_file;
    j["provenance"]["package_hash"] = record.provenance.package_hash;

    j["stubs"]["bin_stubs"] = record.stubs.bin_stubs;
    if (record.stubs.library_stub.empty()) {
        j["stubs"]["library_stub"] = nullptr;
    } else {
        j["stubs"]["library_stub"] = record.stubs.library_stub;
    }
    j["stubs"]["library_stub_requested"] = record.stubs.library_stub_requested;

    return j.dump(2) + "\n";
}

std::string descriptor_path(const std::string& install_dir, const std::string& full_name) {
    return join_path(join_path(install_dir, layout::SPECIFICATIONS_DIR),
                     full_name + layout::DESCRIPTOR_EXTENSION);
}

InstalledRecordParseResult load_installed_record(const std::string& install_dir,
                                                 const std::string& path) {
    auto content = read_text_file(path);
    if (!content) {
        InstalledRecordParseResult result;
        result.record.source_path = path;
        result.error = "failed to read " + path;
        return result;
    }

    auto result = parse_installed_record(*content, path);
    if (result.ok) {
        result.record.spec.installation_path = install_dir;
        result.record.spec.loaded_from = path;
    }
    return result;
}

} // namespace lode
