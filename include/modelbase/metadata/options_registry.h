/**
 * @file options_registry.h
 * @brief Named providers of dynamic field options.
 */

#ifndef MODELBASE_OPTIONS_REGISTRY_H
#define MODELBASE_OPTIONS_REGISTRY_H

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mdb {
    /// Produces the options of an Enum-like field, `{value: label}` or an array of values.
    using OptionsProvider = std::function<nlohmann::ordered_json()>;

    /**
     * @brief Registry of dynamic option providers, looked up by name.
     *
     * Schema fields refer to a provider with `optionsProvider`, e.g.
     * `"Users::getUserTypes"`; the metadata engine resolves it while loading.
     *
     * @code
     * registry.add("Users::getUserTypes", [] {
     *     return json{{"admin", "Administrator"}, {"user", "Regular User"}};
     * });
     * @endcode
     */
    class OptionsRegistry {
    public:
        void add(const std::string &name, OptionsProvider provider);

        void remove(const std::string &name);

        [[nodiscard]] bool has(const std::string &name) const;

        /**
         * @brief Run the provider registered under `name`.
         *
         * Unknown providers, providers that throw and providers returning
         * something other than an object or array are logged.
         *
         * @return Options, `std::nullopt` on any failure.
         */
        [[nodiscard]] std::optional<nlohmann::ordered_json> resolve(const std::string &name) const;

        [[nodiscard]] std::vector<std::string> names() const;

    private:
        std::map<std::string, OptionsProvider> m_providers;
    };
} // mdb

#endif //MODELBASE_OPTIONS_REGISTRY_H
