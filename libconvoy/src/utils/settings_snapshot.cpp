#include "../../include/settings_snapshot.hpp"
#include <stdexcept>

namespace convoy {

    namespace {
        bool is_scalar(const nlohmann::json& v) {
            return !v.is_object() && !v.is_array() && !v.is_binary();
        }
    }

    SettingsSnapshot SettingsSnapshot::from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw SettingsError("settings snapshot must be a JSON object");
        }
        SettingsSnapshot snap;
        for (const auto& [key, value] : j.items()) {
            snap.set(key, value);
        }
        return snap;
    }

    void SettingsSnapshot::set(const std::string& key, nlohmann::json value) {
        if (!is_scalar(value)) {
            throw SettingsError("nested value rejected for setting '" + key + "'");
        }
        values_[key] = std::move(value);
    }

    bool SettingsSnapshot::contains(const std::string& key) const {
        return values_.contains(key);
    }

    bool SettingsSnapshot::get_bool(const std::string& key, const bool fallback) const {
        const auto it = values_.find(key);
        if (it == values_.end() || it->is_null()) return fallback;
        if (!it->is_boolean()) {
            throw SettingsError("setting '" + key + "' is not a boolean");
        }
        return it->get<bool>();
    }

    std::int64_t SettingsSnapshot::get_int(const std::string& key, const std::int64_t fallback) const {
        const auto it = values_.find(key);
        if (it == values_.end() || it->is_null()) return fallback;
        if (!it->is_number_integer()) {
            throw SettingsError("setting '" + key + "' is not an integer");
        }
        return it->get<std::int64_t>();
    }

    std::string SettingsSnapshot::get_string(const std::string& key, const std::string& fallback) const {
        const auto it = values_.find(key);
        if (it == values_.end() || it->is_null()) return fallback;
        if (!it->is_string()) {
            throw SettingsError("setting '" + key + "' is not a string");
        }
        return it->get<std::string>();
    }

} // namespace convoy
