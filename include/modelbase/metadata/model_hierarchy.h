/**
 * @file model_hierarchy.h
 * @brief Explicit entity class ancestry.
 */

#ifndef MODELBASE_MODEL_HIERARCHY_H
#define MODELBASE_MODEL_HIERARCHY_H

#include <string>
#include <unordered_map>
#include <vector>

namespace mdb {
    /**
     * @brief Records which entity class extends which.
     *
     * Entity classes are plain names here; the parent of a class is declared
     * through the `extends` key of its schema or by calling `declare()`.
     */
    class ModelHierarchy {
    public:
        /**
         * @brief Declare `parent` as the direct parent of `entity_class`.
         *
         * An empty parent removes the declaration.
         */
        void declare(const std::string &entity_class, const std::string &parent);

        /// Direct parent, empty if `entity_class` is a root.
        [[nodiscard]] std::string parentOf(const std::string &entity_class) const;

        /**
         * @brief Ancestry of `entity_class`, base first, the class itself last.
         *
         * A cyclic declaration is cut at the first repeated class.
         */
        [[nodiscard]] std::vector<std::string> ancestry(const std::string &entity_class) const;

        /// Whether `entity_class` is `ancestor` or inherits from it.
        [[nodiscard]] bool inheritsFrom(const std::string &entity_class, const std::string &ancestor) const;

        void clear();

    private:
        std::unordered_map<std::string, std::string> m_parents;
    };
} // mdb

#endif //MODELBASE_MODEL_HIERARCHY_H
