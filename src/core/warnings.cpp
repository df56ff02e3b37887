#include "lode/warnings.hpp"

#include <spdlog/spdlog.h>

namespace lode {

WarningCollector::WarningCollector(const HostConfig* config) {
    set_config(config);
}

void WarningCollector::set_config(const HostConfig* config) {
    policy_ = config ? config->warnings : std::unordered_map<std::string, WarningAction>{};
}

WarningAction WarningCollector::action_for(Warning warning) const {
    auto it = policy_.find(warning_to_string(warning));
    return it == policy_.end() ? WarningAction::Warn : it->second;
}

void WarningCollector::emit(Warning warning, WarningFields fields) {
    const char* key = warning_to_string(warning);
    WarningAction action = action_for(warning);

    if (action == WarningAction::Ignore) {
        spdlog::debug("ignoring warning {} by policy", key);
        return;
    }
    if (action == WarningAction::Error) {
        ++errors_;
    }

    WarningObject obj;
    obj.key = key;
    obj.action = action_to_string(action);
    obj.fields = std::move(fields);
    spdlog::debug("{}", format_warning(obj));
    warnings_.push_back(std::move(obj));
}

std::string format_warning(const WarningObject& warning) {
    for (const char* field : {"message", "context"}) {
        auto it = warning.fields.find(field);
        if (it != warning.fields.end() && !it->second.empty()) {
            return warning.key + ": " + it->second;
        }
    }
    return warning.key;
}

} // namespace lode
