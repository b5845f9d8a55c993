#include "../../include/modelbase/fields/field_base.h"
#include "../../include/modelbase/validation/validation_rule_factory.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    const std::vector<std::string> &baseOperators() {
        static const std::vector<std::string> ops = {"equals", "notEquals", "isNull", "isNotNull"};
        return ops;
    }

    FieldBase::FieldBase(FieldDescriptor descriptor)
        : m_descriptor(std::move(descriptor)),
          m_value(m_descriptor.defaultValue()) {
    }

    const FieldDescriptor &FieldBase::descriptor() const { return m_descriptor; }

    const std::string &FieldBase::name() const { return m_descriptor.name(); }

    FieldType FieldBase::type() const { return m_descriptor.type(); }

    std::string FieldBase::reactComponent() const { return "TextInput"; }

    std::vector<std::string> FieldBase::defaultOperators() const { return baseOperators(); }

    std::vector<std::string> FieldBase::operators() const {
        return m_descriptor.operators().value_or(defaultOperators());
    }

    const nlohmann::ordered_json &FieldBase::value() const { return m_value; }

    bool FieldBase::setValue(const nlohmann::ordered_json &value) {
        const auto normalized = normalize(value);
        const RuleContext ctx{m_descriptor};

        if (auto errors = checkValue(normalized, ctx); !errors.empty()) {
            logger::warn("Rejected value `{}` for field `{}`: {}", value.dump(), name(), errors.front());
            m_errors = std::move(errors);
            return false;
        }

        m_value = normalized;
        m_errors.clear();
        return true;
    }

    void FieldBase::setValueFromTrustedSource(const nlohmann::ordered_json &value) {
        m_value = value;
        m_errors.clear();
    }

    std::vector<std::string> FieldBase::validate(const RuleContext &ctx) {
        m_errors = checkValue(m_value, ctx);
        return m_errors;
    }

    const std::vector<std::string> &FieldBase::validationErrors() const { return m_errors; }

    void FieldBase::setUpValidationRules(const ValidationRuleFactory &factory) {
        m_rules.clear();

        auto names = impliedRules();
        if (m_descriptor.required())
            names.insert(names.begin(), "Required");
        for (const auto &rule: m_descriptor.validationRules()) {
            if (std::ranges::find(names, rule) == names.end())
                names.push_back(rule);
        }

        for (const auto &rule_name: names) {
            if (std::ranges::find(m_descriptor.validationRules(), rule_name) == m_descriptor.validationRules().end()
                && !factory.has(rule_name))
                continue;

            try {
                auto rule = factory.create(rule_name);
                if (!rule->appliesToType(type()))
                    logger::debug("Rule `{}` is not meant for {} field `{}`", rule_name, m_descriptor.typeName(), name());
                m_rules.push_back(std::move(rule));
            } catch (const SchemaError &e) {
                logger::warn("Skipping validation rule `{}` on field `{}`: {}", rule_name, name(), e.what());
            }
        }
    }

    const std::vector<std::unique_ptr<ValidationRule>> &FieldBase::rules() const { return m_rules; }

    nlohmann::ordered_json FieldBase::toJSON() const {
        auto out = m_descriptor.toJSON();
        out["reactComponent"] = reactComponent();
        out["operators"] = operators();
        return out;
    }

    std::optional<std::string> FieldBase::checkType(const nlohmann::ordered_json &value) const {
        if (!value.is_string())
            return std::format("{} expects a string value", name());
        return std::nullopt;
    }

    nlohmann::ordered_json FieldBase::normalize(const nlohmann::ordered_json &value) const {
        return value;
    }

    std::vector<std::string> FieldBase::impliedRules() const {
        return {};
    }

    std::vector<std::string> FieldBase::checkValue(const nlohmann::ordered_json &value, const RuleContext &ctx) const {
        std::vector<std::string> errors;

        if (!value.is_null()) {
            if (auto err = checkType(value); err.has_value()) {
                errors.push_back(err.value());
                return errors;
            }
        }

        for (const auto &rule: m_rules) {
            if (auto err = rule->validate(value, ctx); err.has_value())
                errors.push_back(err.value());
        }
        return errors;
    }
} // mdb
