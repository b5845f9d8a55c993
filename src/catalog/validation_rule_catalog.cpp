#include "../../include/modelbase/catalog/validation_rule_catalog.h"
#include "../../include/modelbase/validation/validation_rule_factory.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    bool ValidationRuleDescriptor::appliesToType(const std::string &type) const {
        return appliesTo.empty() || std::ranges::find(appliesTo, type) != appliesTo.end();
    }

    nlohmann::ordered_json ValidationRuleDescriptor::toJSON() const {
        return {
            {"name", name},
            {"class", className},
            {"description", description},
            {"javascript_validation", javascriptValidation},
            {"applies_to", appliesTo}
        };
    }

    ValidationRuleDescriptor ValidationRuleDescriptor::fromJSON(const nlohmann::ordered_json &data) {
        ValidationRuleDescriptor d;
        d.name = data.value("name", "");
        d.className = data.value("class", "");
        d.description = data.value("description", "");
        d.javascriptValidation = data.value("javascript_validation", "");
        d.appliesTo = data.value("applies_to", std::vector<std::string>{});
        return d;
    }

    ValidationRuleCatalog::ValidationRuleCatalog(const ValidationRuleFactory &factory)
        : m_factory(factory) {
    }

    std::vector<ValidationRuleDescriptor> ValidationRuleCatalog::discover() const {
        std::vector<ValidationRuleDescriptor> out;

        for (const auto &class_name: m_factory.classNames()) {
            try {
                const auto rule = m_factory.create(class_name);

                ValidationRuleDescriptor d;
                d.name = ValidationRuleFactory::ruleNameFromClassName(class_name);
                d.className = class_name;
                d.description = rule->description();
                d.javascriptValidation = rule->javascriptValidation();
                for (const auto type: rule->appliesTo())
                    d.appliesTo.push_back(fieldTypeToString(type));

                out.push_back(std::move(d));
            } catch (const std::exception &e) {
                logger::warn("Skipping validation rule `{}`, it failed to instantiate: {}", class_name, e.what());
            }
        }

        logger::debug("Discovered {} validation rules", out.size());
        return out;
    }

    std::vector<std::string> ValidationRuleCatalog::rulesForType(const std::vector<ValidationRuleDescriptor> &rules,
                                                                 const std::string &type) {
        std::vector<std::string> out;
        for (const auto &rule: rules) {
            if (rule.appliesToType(type))
                out.push_back(rule.name);
        }
        return out;
    }
} // mdb
