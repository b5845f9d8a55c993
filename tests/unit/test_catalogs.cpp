#include <gtest/gtest.h>

#include "modelbase/catalog/field_type_catalog.h"
#include "modelbase/catalog/validation_rule_catalog.h"
#include "modelbase/core/exceptions.h"
#include "modelbase/fields/field_factory.h"
#include "modelbase/validation/validation_rule_factory.h"
#include "modelbase/utils/utils.h"

namespace {
    const mdb::ValidationRuleDescriptor *findRule(const std::vector<mdb::ValidationRuleDescriptor> &rules,
                                                  const std::string &name) {
        const auto it = std::ranges::find_if(rules, [&](const auto &r) { return r.name == name; });
        return it == rules.end() ? nullptr : &*it;
    }

    const mdb::FieldTypeDescriptor *findType(const std::vector<mdb::FieldTypeDescriptor> &types,
                                             const std::string &type) {
        const auto it = std::ranges::find_if(types, [&](const auto &t) { return t.type == type; });
        return it == types.end() ? nullptr : &*it;
    }
}

TEST(ValidationRuleCatalog, DiscoversBuiltInRules) {
    const mdb::ValidationRuleFactory factory;
    const auto rules = mdb::ValidationRuleCatalog(factory).discover();

    ASSERT_EQ(rules.size(), 10);

    const auto *email = findRule(rules, "Email");
    ASSERT_NE(email, nullptr);
    EXPECT_EQ(email->className, "EmailValidation");
    EXPECT_FALSE(email->description.empty());
    EXPECT_NE(email->javascriptValidation.find("function"), std::string::npos);
    EXPECT_EQ(email->appliesTo, (std::vector<std::string>{"Text", "Email"}));

    const auto *required = findRule(rules, "Required");
    ASSERT_NE(required, nullptr);
    EXPECT_TRUE(required->appliesTo.empty());
    EXPECT_TRUE(required->appliesToType("Image"));
}

TEST(ValidationRuleCatalog, RulesForType) {
    const mdb::ValidationRuleFactory factory;
    const auto rules = mdb::ValidationRuleCatalog(factory).discover();

    const auto for_password = mdb::ValidationRuleCatalog::rulesForType(rules, "Password");
    EXPECT_NE(std::ranges::find(for_password, "PasswordStrength"), for_password.end());
    EXPECT_NE(std::ranges::find(for_password, "Required"), for_password.end());
    EXPECT_EQ(std::ranges::find(for_password, "Email"), for_password.end());
}

TEST(ValidationRuleCatalog, ToJSONKeys) {
    const mdb::ValidationRuleFactory factory;
    const auto rules = mdb::ValidationRuleCatalog(factory).discover();

    const auto data = findRule(rules, "VideoURL")->toJSON();
    EXPECT_EQ(data["name"], "VideoURL");
    EXPECT_EQ(data["class"], "VideoURLValidation");
    EXPECT_TRUE(data.contains("javascript_validation"));
    EXPECT_EQ(data["applies_to"], mdb::json::array({"Video"}));

    EXPECT_EQ(mdb::ValidationRuleDescriptor::fromJSON(data).className, "VideoURLValidation");
}

TEST(ValidationRuleCatalog, SkipsRulesThatFailToInstantiate) {
    mdb::ValidationRuleFactory factory;
    factory.add("BrokenValidation", []() -> std::unique_ptr<mdb::ValidationRule> {
        throw std::runtime_error("no can do");
    });
    factory.add("NullValidation", [] { return std::unique_ptr<mdb::ValidationRule>(); });

    const auto rules = mdb::ValidationRuleCatalog(factory).discover();

    EXPECT_EQ(rules.size(), 10);
    EXPECT_EQ(findRule(rules, "Broken"), nullptr);
    EXPECT_EQ(findRule(rules, "Null"), nullptr);
}

TEST(FieldTypeCatalog, DiscoversBuiltInTypes) {
    const mdb::FieldFactory fields;
    const mdb::ValidationRuleFactory rules;
    const mdb::ValidationRuleCatalog rule_catalog(rules);

    const auto types = mdb::FieldTypeCatalog(fields, rule_catalog).discover();
    ASSERT_EQ(types.size(), 16);

    const auto *date_time = findType(types, "DateTime");
    ASSERT_NE(date_time, nullptr);
    EXPECT_EQ(date_time->className, "DateTimeField");
    EXPECT_EQ(date_time->description, "date time field");
    EXPECT_EQ(date_time->reactComponent, "DateTimePicker");
    EXPECT_NE(std::ranges::find(date_time->validationRules, "DateTime"), date_time->validationRules.end());

    const auto *password = findType(types, "Password");
    ASSERT_NE(password, nullptr);
    EXPECT_EQ(password->operators, (std::vector<std::string>{"isNull", "isNotNull"}));
}

TEST(FieldTypeCatalog, ToJSONKeys) {
    const mdb::FieldFactory fields;
    const mdb::ValidationRuleFactory rules;
    const mdb::ValidationRuleCatalog rule_catalog(rules);

    const auto types = mdb::FieldTypeCatalog(fields, rule_catalog).discover();
    const auto data = findType(types, "ID")->toJSON();

    EXPECT_EQ(data["type"], "ID");
    EXPECT_EQ(data["class"], "IDField");
    EXPECT_EQ(data["description"], "id field");
    EXPECT_EQ(data["react_component"], "HiddenInput");
    EXPECT_TRUE(data["operators"].is_array());
    EXPECT_TRUE(data["validation_rules"].is_array());
}

TEST(FieldTypeCatalog, SkipsTypesThatFailToInstantiate) {
    mdb::FieldFactory fields;
    fields.add("ExplodingField", [](const mdb::FieldDescriptor &) -> std::unique_ptr<mdb::FieldBase> {
        throw mdb::SchemaError("exploded");
    });

    const mdb::ValidationRuleFactory rules;
    const mdb::ValidationRuleCatalog rule_catalog(rules);
    const auto types = mdb::FieldTypeCatalog(fields, rule_catalog).discover();

    EXPECT_EQ(types.size(), 16);
    EXPECT_EQ(findType(types, "Exploding"), nullptr);
}
