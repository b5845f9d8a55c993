/**
 * @file core_fields.h
 * @brief Framework-wide fields every entity carries, plus per-class additions.
 *
 * The standard set (id, audit timestamps, soft-delete markers, ...) comes from
 * a JSON template. Entity classes may register extra core fields; a class sees
 * the registrations of all of its ancestors, the most derived one winning.
 */

#ifndef MODELBASE_CORE_FIELDS_H
#define MODELBASE_CORE_FIELDS_H

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "field_descriptor.h"
#include "model_hierarchy.h"

namespace mdb {
    class CoreFieldsProvider {
    public:
        /**
         * @param template_path JSON file holding the standard core fields, an
         * object keyed by field name.
         */
        explicit CoreFieldsProvider(std::string template_path);

        /**
         * @brief The standard core fields, loaded from the template on first use.
         * @throws ConfigurationError if the template is missing, unparsable, not a
         * JSON object, or holds an invalid field entry.
         */
        const FieldList &standardCoreFields();

        /**
         * @brief Register (or overwrite) additional core fields for one entity class.
         *
         * Only the merged sets of `entity_class` and of classes inheriting from
         * it are invalidated.
         */
        void registerModelCoreFields(const std::string &entity_class, const FieldList &fields);

        /**
         * @brief Union of the registrations along the class ancestry.
         *
         * Base classes are applied first so the most derived registration wins
         * on a name collision.
         */
        [[nodiscard]] FieldList modelCoreFields(const std::string &entity_class) const;

        /**
         * @brief Standard core fields merged with `modelCoreFields()`, model-specific
         * fields winning. Cached per class.
         */
        FieldList allCoreFieldsForModel(const std::string &entity_class);

        /**
         * @brief A core field of `entity_class` with `overrides` applied.
         *
         * `name` and `type` can't be overridden; attempts are ignored with a warning.
         *
         * @return Overridden copy, `std::nullopt` (and a warning) if the field is not a core field.
         */
        std::optional<FieldDescriptor> coreFieldWithOverrides(const std::string &field_name,
                                                              const std::string &entity_class,
                                                              const nlohmann::ordered_json &overrides);

        /**
         * @brief Whether `field_name` is a core field.
         * @param field_name Field to check
         * @param entity_class Class whose registrations count too; standard set only if empty.
         */
        bool isCoreField(const std::string &field_name, const std::string &entity_class = "");

        std::vector<std::string> coreFieldNames(const std::string &entity_class = "");

        /// Drop every merged set; the loaded template and registrations are kept.
        void clearCache();

        void clearCacheForModel(const std::string &entity_class);

        /// Point at another template; the loaded one is dropped.
        void setTemplatePath(const std::string &path);

        [[nodiscard]] const std::string &templatePath() const;

        /// Declare the parent class of `entity_class`, invalidating affected merged sets.
        void declareParent(const std::string &entity_class, const std::string &parent);

        [[nodiscard]] const ModelHierarchy &hierarchy() const;

        /**
         * @brief Check a raw core field entry carries `name`, `type`, `label` and `isDBField`.
         *
         * Logs a warning naming the first missing key.
         */
        static bool validateCoreFieldMetadata(const nlohmann::ordered_json &field);

    private:
        void invalidateDescendants(const std::string &entity_class);

        std::string m_templatePath;
        std::optional<FieldList> m_standardFields;
        std::unordered_map<std::string, FieldList> m_registrations;
        std::unordered_map<std::string, FieldList> m_mergedCache;
        ModelHierarchy m_hierarchy;
    };
} // mdb

#endif //MODELBASE_CORE_FIELDS_H
