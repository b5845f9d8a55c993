/**
 * @file validation_rule_factory.h
 * @brief Registry of validation rule implementations, keyed by class name.
 */

#ifndef MODELBASE_VALIDATION_RULE_FACTORY_H
#define MODELBASE_VALIDATION_RULE_FACTORY_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "validation_rule.h"

namespace mdb {
    using ValidationRuleCreator = std::function<std::unique_ptr<ValidationRule>()>;

    class ValidationRuleFactory {
    public:
        /// Factory preloaded with the built-in rules.
        ValidationRuleFactory();

        /**
         * @brief Register a rule implementation.
         * @param class_name Class name, conventionally `<Name>Validation`
         * @param creator Builds a fresh instance
         */
        void add(const std::string &class_name, ValidationRuleCreator creator);

        void remove(const std::string &class_name);

        /**
         * @brief Instantiate a rule by short name (`Email`) or class name (`EmailValidation`).
         * @throws SchemaError if no such rule is registered.
         */
        [[nodiscard]] std::unique_ptr<ValidationRule> create(const std::string &name) const;

        [[nodiscard]] bool has(const std::string &name) const;

        /// Registered class names, sorted.
        [[nodiscard]] std::vector<std::string> classNames() const;

        /// `EmailValidation` -> `Email`.
        static std::string ruleNameFromClassName(const std::string &class_name);

    private:
        [[nodiscard]] std::string resolveClassName(const std::string &name) const;

        std::map<std::string, ValidationRuleCreator> m_creators;
    };
} // mdb

#endif //MODELBASE_VALIDATION_RULE_FACTORY_H
