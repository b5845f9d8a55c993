/**
 * @file validation_rule_catalog.h
 * @brief Describes the available validation rules.
 */

#ifndef MODELBASE_VALIDATION_RULE_CATALOG_H
#define MODELBASE_VALIDATION_RULE_CATALOG_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../metadata/field_descriptor.h"

namespace mdb {
    class ValidationRuleFactory;

    struct ValidationRuleDescriptor {
        std::string name;
        std::string className;
        std::string description;
        std::string javascriptValidation;
        /// Field type names the rule is meant for; empty means all.
        std::vector<std::string> appliesTo;

        [[nodiscard]] bool appliesToType(const std::string &type) const;

        [[nodiscard]] nlohmann::ordered_json toJSON() const;

        static ValidationRuleDescriptor fromJSON(const nlohmann::ordered_json &data);
    };

    class ValidationRuleCatalog {
    public:
        explicit ValidationRuleCatalog(const ValidationRuleFactory &factory);

        /**
         * @brief Instantiate every registered rule once and describe it.
         *
         * A rule that fails to instantiate is logged and left out.
         */
        [[nodiscard]] std::vector<ValidationRuleDescriptor> discover() const;

        /// Names of the discovered rules meant for fields of `type`.
        [[nodiscard]] static std::vector<std::string> rulesForType(const std::vector<ValidationRuleDescriptor> &rules,
                                                                   const std::string &type);

    private:
        const ValidationRuleFactory &m_factory;
    };
} // mdb

#endif //MODELBASE_VALIDATION_RULE_CATALOG_H
