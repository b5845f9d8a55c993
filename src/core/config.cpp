#include "../../include/modelbase/core/config.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    namespace {
        struct EnvOverride {
            const char *env;
            const char *key;
        };

        constexpr EnvOverride kEnvOverrides[] = {
            {"MODELBASE_MODELS_DIR", "metadata.models_dir_path"},
            {"MODELBASE_RELATIONSHIPS_DIR", "metadata.relationships_dir_path"},
            {"MODELBASE_CACHE_DIR", "metadata.cache_dir_path"},
            {"MODELBASE_CORE_FIELDS_TEMPLATE", "metadata.core_fields_template"},
            {"MODELBASE_LOG_LEVEL", "logging.level"},
        };
    }

    Config::Config() : m_configs(defaults()) {
        applyEnvironment();
    }

    Config::Config(const nlohmann::ordered_json &overrides) : m_configs(defaults()) {
        if (!overrides.is_object())
            throw ConfigurationError("Configuration overrides must be a JSON object");

        m_configs.merge_patch(overrides);
        applyEnvironment();
    }

    Config Config::fromFile(const std::string &path) {
        const auto file = resolvePath(path);
        if (!fs::exists(file))
            throw ConfigurationError(std::format("Config file `{}` does not exist", file.string()));

        const auto data = readJsonFile(file);
        if (!data.has_value())
            throw ConfigurationError(std::format("Config file `{}` could not be parsed", file.string()));

        if (!data->is_object())
            throw ConfigurationError(std::format("Config file `{}` must hold a JSON object", file.string()));

        logger::debug("Loaded config from `{}`", file.string());
        return Config(data.value());
    }

    nlohmann::ordered_json Config::defaults() {
        return {
            {
                "metadata", {
                    {"models_dir_path", "models"},
                    {"relationships_dir_path", "relationships"},
                    {"cache_dir_path", "cache"},
                    {"cache_enabled", true},
                    {"core_fields_template", "resources/core_fields_metadata.json"}
                }
            },
            {
                "logging", {
                    {"level", "info"}
                }
            }
        };
    }

    nlohmann::ordered_json Config::get(const std::string &key, const nlohmann::ordered_json &fallback) const {
        const auto ptr = pointerFor(key);
        if (!m_configs.contains(ptr))
            return fallback;
        return m_configs.at(ptr);
    }

    bool Config::has(const std::string &key) const {
        return m_configs.contains(pointerFor(key));
    }

    Config &Config::set(const std::string &key, const nlohmann::ordered_json &value) {
        m_configs[pointerFor(key)] = value;
        return *this;
    }

    const nlohmann::ordered_json &Config::configs() const { return m_configs; }

    std::string Config::modelsDir() const {
        return get("metadata.models_dir_path", "models").get<std::string>();
    }

    std::string Config::relationshipsDir() const {
        return get("metadata.relationships_dir_path", "relationships").get<std::string>();
    }

    std::string Config::cacheDir() const {
        return get("metadata.cache_dir_path", "cache").get<std::string>();
    }

    bool Config::cacheEnabled() const {
        const auto value = get("metadata.cache_enabled", true);
        if (value.is_boolean())
            return value.get<bool>();
        if (value.is_string())
            return strToBool(value.get<std::string>());
        return true;
    }

    std::string Config::coreFieldsTemplate() const {
        return get("metadata.core_fields_template", "resources/core_fields_metadata.json").get<std::string>();
    }

    std::string Config::logLevel() const {
        return get("logging.level", "info").get<std::string>();
    }

    void Config::applyEnvironment() {
        for (const auto &[env, key]: kEnvOverrides) {
            const auto value = getEnvOrDefault(env, "");
            if (value.empty()) continue;

            logger::trace("Config `{}` overridden by ${}", key, env);
            set(key, value);
        }
    }

    nlohmann::ordered_json::json_pointer Config::pointerFor(const std::string &key) {
        std::string path;
        for (const auto &part: splitString(key, "."))
            path += "/" + part;
        return nlohmann::ordered_json::json_pointer(path);
    }
} // mdb
