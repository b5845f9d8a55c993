#include "../../include/modelbase/catalog/field_type_catalog.h"
#include "../../include/modelbase/fields/field_factory.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    nlohmann::ordered_json FieldTypeDescriptor::toJSON() const {
        return {
            {"type", type},
            {"class", className},
            {"description", description},
            {"react_component", reactComponent},
            {"operators", operators},
            {"validation_rules", validationRules}
        };
    }

    FieldTypeDescriptor FieldTypeDescriptor::fromJSON(const nlohmann::ordered_json &data) {
        FieldTypeDescriptor d;
        d.type = data.value("type", "");
        d.className = data.value("class", "");
        d.description = data.value("description", "");
        d.reactComponent = data.value("react_component", "");
        d.operators = data.value("operators", std::vector<std::string>{});
        d.validationRules = data.value("validation_rules", std::vector<std::string>{});
        return d;
    }

    FieldTypeCatalog::FieldTypeCatalog(const FieldFactory &factory, const ValidationRuleCatalog &rules)
        : m_factory(factory),
          m_rules(rules) {
    }

    std::vector<FieldTypeDescriptor> FieldTypeCatalog::discover() const {
        TRACE_METHOD();

        const auto rules = m_rules.discover();
        std::vector<FieldTypeDescriptor> out;

        for (const auto &class_name: m_factory.classNames()) {
            const auto type = FieldFactory::typeFromClassName(class_name);
            try {
                // Custom implementations outside the closed type set are probed as Text
                const auto probe_type = fieldTypeFromString(type).value_or(FieldType::Text);
                const auto field = m_factory.create(class_name, FieldDescriptor("", probe_type));

                FieldTypeDescriptor d;
                d.type = type;
                d.className = class_name;
                d.description = descriptionFromClassName(class_name);
                d.reactComponent = field->reactComponent();
                d.operators = field->operators();
                d.validationRules = ValidationRuleCatalog::rulesForType(rules, type);

                out.push_back(std::move(d));
            } catch (const std::exception &e) {
                logger::warn("Skipping field type `{}`, it failed to instantiate: {}", class_name, e.what());
            }
        }

        logger::debug("Discovered {} field types", out.size());
        return out;
    }

    std::string FieldTypeCatalog::descriptionFromClassName(const std::string &class_name) {
        return camelCaseToWords(class_name);
    }
} // mdb
