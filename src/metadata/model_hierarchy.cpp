#include "../../include/modelbase/metadata/model_hierarchy.h"
#include "../../include/modelbase/core/logger.h"

#include <algorithm>

namespace mdb {
    void ModelHierarchy::declare(const std::string &entity_class, const std::string &parent) {
        if (parent.empty() || parent == entity_class) {
            m_parents.erase(entity_class);
            return;
        }
        m_parents[entity_class] = parent;
    }

    std::string ModelHierarchy::parentOf(const std::string &entity_class) const {
        const auto it = m_parents.find(entity_class);
        return it == m_parents.end() ? "" : it->second;
    }

    std::vector<std::string> ModelHierarchy::ancestry(const std::string &entity_class) const {
        std::vector<std::string> chain;
        auto current = entity_class;

        while (!current.empty()) {
            if (std::ranges::find(chain, current) != chain.end()) {
                logger::warn("Cyclic inheritance detected at `{}` while resolving `{}`", current, entity_class);
                break;
            }
            chain.push_back(current);
            current = parentOf(current);
        }

        std::ranges::reverse(chain);
        return chain;
    }

    bool ModelHierarchy::inheritsFrom(const std::string &entity_class, const std::string &ancestor) const {
        const auto chain = ancestry(entity_class);
        return std::ranges::find(chain, ancestor) != chain.end();
    }

    void ModelHierarchy::clear() {
        m_parents.clear();
    }
} // mdb
