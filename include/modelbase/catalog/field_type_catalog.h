/**
 * @file field_type_catalog.h
 * @brief Describes the available field types for tooling and frontends.
 */

#ifndef MODELBASE_FIELD_TYPE_CATALOG_H
#define MODELBASE_FIELD_TYPE_CATALOG_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "validation_rule_catalog.h"

namespace mdb {
    class FieldFactory;

    struct FieldTypeDescriptor {
        std::string type;
        std::string className;
        std::string description;
        std::string reactComponent;
        std::vector<std::string> operators;
        std::vector<std::string> validationRules;

        [[nodiscard]] nlohmann::ordered_json toJSON() const;

        static FieldTypeDescriptor fromJSON(const nlohmann::ordered_json &data);
    };

    class FieldTypeCatalog {
    public:
        FieldTypeCatalog(const FieldFactory &factory, const ValidationRuleCatalog &rules);

        /**
         * @brief Describe every registered field implementation.
         *
         * Each implementation is instantiated with an empty configuration to read
         * its component and operators; one that fails is logged and left out.
         */
        [[nodiscard]] std::vector<FieldTypeDescriptor> discover() const;

        /// `DateTimeField` -> `date time field`.
        static std::string descriptionFromClassName(const std::string &class_name);

    private:
        const FieldFactory &m_factory;
        const ValidationRuleCatalog &m_rules;
    };
} // mdb

#endif //MODELBASE_FIELD_TYPE_CATALOG_H
