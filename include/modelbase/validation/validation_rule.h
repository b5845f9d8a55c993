/**
 * @file validation_rule.h
 * @brief Field value validation rules.
 *
 * Rules are referenced by short name (`Email`) from field descriptors and
 * instantiated through the ValidationRuleFactory under their class name
 * (`EmailValidation`).
 */

#ifndef MODELBASE_VALIDATION_RULE_H
#define MODELBASE_VALIDATION_RULE_H

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../metadata/field_descriptor.h"

namespace mdb {
    class DatabaseConnector;

    using json = nlohmann::ordered_json;

    /**
     * @brief Everything a rule may need besides the value itself.
     */
    struct RuleContext {
        const FieldDescriptor &field;
        /// Optional, rules needing storage pass when it is absent.
        DatabaseConnector *db = nullptr;
        /// Table of the record being validated.
        std::string table;
        /// Id of the record being validated, `null` for new records.
        json recordId = nullptr;
        /// Table of `field.relatedModel()`, if any.
        std::string relatedTable;
    };

    class ValidationRule {
    public:
        virtual ~ValidationRule() = default;

        /// Short name, e.g. `Email`.
        [[nodiscard]] virtual std::string name() const = 0;

        [[nodiscard]] virtual std::string description() const = 0;

        /**
         * @brief Client side equivalent, a JavaScript function of `value`.
         */
        [[nodiscard]] virtual std::string javascriptValidation() const = 0;

        /// Field types the rule is meant for; empty means all.
        [[nodiscard]] virtual std::vector<FieldType> appliesTo() const { return {}; }

        /**
         * @brief Validate a value.
         * @return Error message, `std::nullopt` if valid.
         */
        [[nodiscard]] virtual std::optional<std::string> validate(const json &value, const RuleContext &ctx) const = 0;

        /// Whether the rule is meant for fields of `type`.
        [[nodiscard]] bool appliesToType(FieldType type) const;

    protected:
        /// Null, empty strings and empty arrays are left to the Required rule.
        static bool isEmptyValue(const json &value);
    };

    class RequiredValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "Required"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    class EmailValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "Email"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    class AlphanumericValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "Alphanumeric"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    class DateTimeValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "DateTime"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    /// Value (or every element of a list value) must be one of the field's options.
    class OptionsValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "Options"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    class URLValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "URL"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    class VideoURLValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "VideoURL"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    class PasswordStrengthValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "PasswordStrength"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    /// The referenced record must exist in the related table.
    class ForeignKeyExistsValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "ForeignKeyExists"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::vector<FieldType> appliesTo() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };

    class UniqueValidation final : public ValidationRule {
    public:
        [[nodiscard]] std::string name() const override { return "Unique"; }

        [[nodiscard]] std::string description() const override;

        [[nodiscard]] std::string javascriptValidation() const override;

        [[nodiscard]] std::optional<std::string> validate(const json &value, const RuleContext &ctx) const override;
    };
} // mdb

#endif //MODELBASE_VALIDATION_RULE_H
