/**
 * @file field_base.h
 * @brief Runtime field: a descriptor, a value and the rules guarding it.
 */

#ifndef MODELBASE_FIELD_BASE_H
#define MODELBASE_FIELD_BASE_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../metadata/field_descriptor.h"
#include "../validation/validation_rule.h"

namespace mdb {
    class ValidationRuleFactory;

    /**
     * @brief Base class of all typed fields.
     *
     * Subclasses define the accepted JSON shape of their values, the UI
     * component hint and the filter operators they support.
     */
    class FieldBase {
    public:
        explicit FieldBase(FieldDescriptor descriptor);

        virtual ~FieldBase() = default;

        FieldBase(const FieldBase &) = delete;

        FieldBase &operator=(const FieldBase &) = delete;

        [[nodiscard]] const FieldDescriptor &descriptor() const;

        [[nodiscard]] const std::string &name() const;

        [[nodiscard]] FieldType type() const;

        /// Frontend component used to edit the field.
        [[nodiscard]] virtual std::string reactComponent() const;

        /// Operators supported when the schema does not declare any.
        [[nodiscard]] virtual std::vector<std::string> defaultOperators() const;

        /// Schema-declared operators if any, `defaultOperators()` otherwise.
        [[nodiscard]] std::vector<std::string> operators() const;

        [[nodiscard]] const nlohmann::ordered_json &value() const;

        /**
         * @brief Set a value after checking its shape and the field's rules.
         *
         * Rules needing storage are skipped here, they run in `validate()`.
         * On failure the previous value is kept, the errors are recorded and a
         * warning is logged.
         *
         * @return true if the value was accepted.
         */
        bool setValue(const nlohmann::ordered_json &value);

        /// Set a value read from storage, without any validation.
        void setValueFromTrustedSource(const nlohmann::ordered_json &value);

        /**
         * @brief Check the current value against shape and all rules.
         * @param ctx Storage context for rules like `Unique` or `ForeignKeyExists`
         * @return Error messages, empty if valid. Also kept in `validationErrors()`.
         */
        std::vector<std::string> validate(const RuleContext &ctx);

        [[nodiscard]] const std::vector<std::string> &validationErrors() const;

        /**
         * @brief Instantiate the rules named by the descriptor, plus the implied ones.
         *
         * Unknown rule names are logged and skipped.
         */
        void setUpValidationRules(const ValidationRuleFactory &factory);

        [[nodiscard]] const std::vector<std::unique_ptr<ValidationRule>> &rules() const;

        /// Descriptor JSON enriched with the component and effective operators.
        [[nodiscard]] nlohmann::ordered_json toJSON() const;

    protected:
        /**
         * @brief Shape check of a non-null value.
         * @return Error message, `std::nullopt` if the value fits the field type.
         */
        [[nodiscard]] virtual std::optional<std::string> checkType(const nlohmann::ordered_json &value) const;

        /// Coerce equivalent representations (e.g. `"42"` for an integer), default is identity.
        [[nodiscard]] virtual nlohmann::ordered_json normalize(const nlohmann::ordered_json &value) const;

        /// Rules the field type implies even if the schema does not list them.
        [[nodiscard]] virtual std::vector<std::string> impliedRules() const;

        [[nodiscard]] std::vector<std::string> checkValue(const nlohmann::ordered_json &value, const RuleContext &ctx) const;

        FieldDescriptor m_descriptor;
        nlohmann::ordered_json m_value = nullptr;
        std::vector<std::unique_ptr<ValidationRule>> m_rules;
        std::vector<std::string> m_errors;
    };

    /// Operators shared by every field type.
    const std::vector<std::string> &baseOperators();
} // mdb

#endif //MODELBASE_FIELD_BASE_H
