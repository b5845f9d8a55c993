#include "../../include/modelbase/metadata/options_registry.h"
#include "../../include/modelbase/core/logger.h"

namespace mdb {
    void OptionsRegistry::add(const std::string &name, OptionsProvider provider) {
        m_providers[name] = std::move(provider);
    }

    void OptionsRegistry::remove(const std::string &name) {
        m_providers.erase(name);
    }

    bool OptionsRegistry::has(const std::string &name) const {
        return m_providers.contains(name);
    }

    std::optional<nlohmann::ordered_json> OptionsRegistry::resolve(const std::string &name) const {
        const auto it = m_providers.find(name);
        if (it == m_providers.end() || !it->second) {
            logger::warn("No options provider registered as `{}`", name);
            return std::nullopt;
        }

        try {
            auto options = it->second();
            if (!(options.is_object() || options.is_array())) {
                logger::warn("Options provider `{}` returned `{}`, expected an object or array",
                             name, options.type_name());
                return std::nullopt;
            }
            return options;
        } catch (const std::exception &e) {
            logger::warn("Options provider `{}` failed: {}", name, e.what());
            return std::nullopt;
        }
    }

    std::vector<std::string> OptionsRegistry::names() const {
        std::vector<std::string> out;
        for (const auto &[name, _]: m_providers)
            out.push_back(name);
        return out;
    }
} // mdb
