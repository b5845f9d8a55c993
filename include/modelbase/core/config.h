/**
 * @file config.h
 * @brief Layered JSON configuration.
 *
 * Values are resolved from built-in defaults, then an optional JSON config file,
 * then environment variables, then explicit `set()` calls (the command line).
 *
 * | key                               | env                              | default                                 |
 * |-----------------------------------|----------------------------------|-----------------------------------------|
 * | `metadata.models_dir_path`        | `MODELBASE_MODELS_DIR`           | `models`                                |
 * | `metadata.relationships_dir_path` | `MODELBASE_RELATIONSHIPS_DIR`    | `relationships`                         |
 * | `metadata.cache_dir_path`         | `MODELBASE_CACHE_DIR`            | `cache`                                 |
 * | `metadata.cache_enabled`          |                                  | `true`                                  |
 * | `metadata.core_fields_template`   | `MODELBASE_CORE_FIELDS_TEMPLATE` | `resources/core_fields_metadata.json`   |
 * | `logging.level`                   | `MODELBASE_LOG_LEVEL`            | `info`                                  |
 */

#ifndef MODELBASE_CONFIG_H
#define MODELBASE_CONFIG_H

#include <string>

#include <nlohmann/json.hpp>

namespace mdb {
    class Config {
    public:
        /// Defaults with environment overrides applied.
        Config();

        /// Defaults, deep-merged with `overrides`, then environment overrides.
        explicit Config(const nlohmann::ordered_json &overrides);

        /**
         * @brief Load a JSON config file on top of the defaults.
         * @throws ConfigurationError if the file can't be read or isn't a JSON object.
         */
        static Config fromFile(const std::string &path);

        static nlohmann::ordered_json defaults();

        /// Value at a dotted key like `metadata.cache_dir_path`, `fallback` if absent.
        [[nodiscard]] nlohmann::ordered_json get(const std::string &key, const nlohmann::ordered_json &fallback = nullptr) const;

        [[nodiscard]] bool has(const std::string &key) const;

        Config &set(const std::string &key, const nlohmann::ordered_json &value);

        [[nodiscard]] const nlohmann::ordered_json &configs() const;

        [[nodiscard]] std::string modelsDir() const;

        [[nodiscard]] std::string relationshipsDir() const;

        [[nodiscard]] std::string cacheDir() const;

        [[nodiscard]] bool cacheEnabled() const;

        [[nodiscard]] std::string coreFieldsTemplate() const;

        [[nodiscard]] std::string logLevel() const;

    private:
        void applyEnvironment();

        static nlohmann::ordered_json::json_pointer pointerFor(const std::string &key);

        nlohmann::ordered_json m_configs;
    };
} // mdb

#endif //MODELBASE_CONFIG_H
