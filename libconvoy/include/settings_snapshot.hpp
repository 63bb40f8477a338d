/**
 * @file settings_snapshot.hpp
 * @brief Flat, serializable key/value copy of the engine settings.
 */

#ifndef CONVOY_SETTINGS_SNAPSHOT_HPP
#define CONVOY_SETTINGS_SNAPSHOT_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace convoy {

    /**
     * @brief Thrown when a snapshot is malformed or a setting has a bad type or value.
     */
    class SettingsError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Immutable-by-convention settings map carried inside each job.
     *
     * Values are restricted to scalars (bool, number, string, null). Any
     * attempt to store an object or an array is rejected with
     * SettingsError, both when setting a single key and when
     * loading a whole map from JSON.
     */
    class SettingsSnapshot {
    public:
        SettingsSnapshot() : values_(nlohmann::json::object()) {}

        /**
         * @brief Builds a snapshot from a JSON object.
         * @throws SettingsError if @p j is not an object or holds nested values.
         */
        static SettingsSnapshot from_json(const nlohmann::json& j);

        [[nodiscard]] const nlohmann::json& to_json() const noexcept { return values_; }

        /**
         * @brief Stores a scalar value.
         * @throws SettingsError if @p value is an object or an array.
         */
        void set(const std::string& key, nlohmann::json value);

        [[nodiscard]] bool contains(const std::string& key) const;
        [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

        /// Typed getters return @p fallback for missing keys and throw
        /// SettingsError when the stored value has another type.
        [[nodiscard]] bool get_bool(const std::string& key, bool fallback) const;
        [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t fallback) const;
        [[nodiscard]] std::string get_string(const std::string& key, const std::string& fallback) const;

    private:
        nlohmann::json values_;
    };

} // namespace convoy

#endif // CONVOY_SETTINGS_SNAPSHOT_HPP
