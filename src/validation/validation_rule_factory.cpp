#include "../../include/modelbase/validation/validation_rule_factory.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    namespace {
        template<typename T>
        ValidationRuleCreator creatorOf() {
            return [] { return std::make_unique<T>(); };
        }
    }

    ValidationRuleFactory::ValidationRuleFactory() {
        add("RequiredValidation", creatorOf<RequiredValidation>());
        add("EmailValidation", creatorOf<EmailValidation>());
        add("AlphanumericValidation", creatorOf<AlphanumericValidation>());
        add("DateTimeValidation", creatorOf<DateTimeValidation>());
        add("OptionsValidation", creatorOf<OptionsValidation>());
        add("URLValidation", creatorOf<URLValidation>());
        add("VideoURLValidation", creatorOf<VideoURLValidation>());
        add("PasswordStrengthValidation", creatorOf<PasswordStrengthValidation>());
        add("ForeignKeyExistsValidation", creatorOf<ForeignKeyExistsValidation>());
        add("UniqueValidation", creatorOf<UniqueValidation>());
    }

    void ValidationRuleFactory::add(const std::string &class_name, ValidationRuleCreator creator) {
        m_creators[class_name] = std::move(creator);
    }

    void ValidationRuleFactory::remove(const std::string &class_name) {
        m_creators.erase(class_name);
    }

    std::string ValidationRuleFactory::resolveClassName(const std::string &name) const {
        if (m_creators.contains(name)) return name;
        if (const auto cls = name + "Validation"; m_creators.contains(cls)) return cls;
        return "";
    }

    std::unique_ptr<ValidationRule> ValidationRuleFactory::create(const std::string &name) const {
        const auto cls = resolveClassName(name);
        if (cls.empty())
            throw SchemaError(std::format("Unknown validation rule `{}`", name));

        auto rule = m_creators.at(cls)();
        if (!rule)
            throw SchemaError(std::format("Validation rule `{}` could not be created", name));
        return rule;
    }

    bool ValidationRuleFactory::has(const std::string &name) const {
        return !resolveClassName(name).empty();
    }

    std::vector<std::string> ValidationRuleFactory::classNames() const {
        std::vector<std::string> out;
        for (const auto &[name, _]: m_creators)
            out.push_back(name);
        return out;
    }

    std::string ValidationRuleFactory::ruleNameFromClassName(const std::string &class_name) {
        if (hasSuffix(class_name, "Validation"))
            return class_name.substr(0, class_name.size() - std::string("Validation").size());
        return class_name;
    }
} // mdb
