#include "latbench/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace latbench {

namespace {

std::string normalize_key(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = get_effective_action(warning_key);

    // Ignored warnings are still collected but marked
    warnings_.push_back({normalize_key(warning_key), std::move(fields), action});
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    overrides_[normalize_key(warning_key)] = action;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_effective_warnings() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action != WarningAction::Ignore;
    });
}

bool WarningCollector::contains(Warning warning) const {
    const std::string key = warning_to_string(warning);
    return std::any_of(warnings_.begin(), warnings_.end(), [&key](const CollectedWarning& w) {
        return w.key == key;
    });
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = normalize_key(key);

    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    return WarningAction::Warn;
}

} // namespace latbench
