#include <gtest/gtest.h>

#include "modelbase/core/exceptions.h"
#include "modelbase/fields/fields.h"
#include "modelbase/fields/field_factory.h"
#include "modelbase/validation/validation_rule_factory.h"
#include "modelbase/utils/utils.h"

namespace {
    std::vector<std::string> ruleNames(const mdb::FieldBase &field) {
        std::vector<std::string> names;
        for (const auto &rule: field.rules())
            names.push_back(rule->name());
        return names;
    }
}

TEST(FieldFactory, CreatesOneImplementationPerType) {
    const mdb::FieldFactory factory;

    for (const auto type: mdb::allFieldTypes()) {
        const auto field = factory.create(mdb::FieldDescriptor("f", type));
        ASSERT_NE(field, nullptr);
        EXPECT_EQ(field->type(), type);
    }

    EXPECT_EQ(factory.classNames().size(), 16);
    EXPECT_EQ(mdb::FieldFactory::typeFromClassName("RadioButtonSetField"), "RadioButtonSet");
    EXPECT_EQ(mdb::FieldFactory::classNameFromType("Text"), "TextField");
}

TEST(FieldFactory, CreateByClassName) {
    const mdb::FieldFactory factory;

    const auto field = factory.create("BigTextField", mdb::FieldDescriptor("body", mdb::FieldType::BigText));
    EXPECT_EQ(field->reactComponent(), "TextArea");
    EXPECT_THROW((void) factory.create("HologramField", mdb::FieldDescriptor("x", mdb::FieldType::Text)),
                 mdb::SchemaError);
}

TEST(FieldFactory, OverrideImplementation) {
    class UpperTextField final : public mdb::TextField {
    public:
        using TextField::TextField;

        [[nodiscard]] std::string reactComponent() const override { return "UpperInput"; }
    };

    mdb::FieldFactory factory;
    factory.add("TextField", [](const mdb::FieldDescriptor &d) { return std::make_unique<UpperTextField>(d); });

    EXPECT_EQ(factory.create(mdb::FieldDescriptor("code", mdb::FieldType::Text))->reactComponent(), "UpperInput");

    factory.remove("TextField");
    EXPECT_FALSE(factory.has("TextField"));
    EXPECT_THROW((void) factory.create(mdb::FieldDescriptor("code", mdb::FieldType::Text)), mdb::SchemaError);
}

TEST(Fields, IntegerNormalizationAndBounds) {
    mdb::FieldDescriptor descriptor("rating", mdb::FieldType::Integer);
    descriptor.setExtra("minValue", 0).setExtra("maxValue", 10);
    mdb::IntegerField field(descriptor);

    EXPECT_TRUE(field.setValue("7"));
    EXPECT_EQ(field.value(), 7);

    EXPECT_TRUE(field.setValue(4.0));
    EXPECT_EQ(field.value(), 4);

    EXPECT_FALSE(field.setValue(11));
    EXPECT_EQ(field.value(), 4);
    ASSERT_EQ(field.validationErrors().size(), 1);

    EXPECT_FALSE(field.setValue("seven"));
    EXPECT_EQ(field.value(), 4);

    EXPECT_TRUE(field.setValue(nullptr));
    EXPECT_TRUE(field.validationErrors().empty());
}

TEST(Fields, BooleanNormalization) {
    mdb::BooleanField field(mdb::FieldDescriptor("active", mdb::FieldType::Boolean));

    EXPECT_TRUE(field.setValue("yes"));
    EXPECT_EQ(field.value(), true);
    EXPECT_TRUE(field.setValue(0));
    EXPECT_EQ(field.value(), false);
    EXPECT_FALSE(field.setValue("maybe"));
}

TEST(Fields, TextMaxLength) {
    mdb::FieldDescriptor descriptor("title", mdb::FieldType::Text);
    descriptor.setExtra("maxLength", 5);
    mdb::TextField field(descriptor);

    EXPECT_TRUE(field.setValue("Heat"));
    EXPECT_FALSE(field.setValue("Heat 2"));
    EXPECT_EQ(field.value(), "Heat");
    EXPECT_FALSE(field.setValue(42));
}

TEST(Fields, MultiEnumShape) {
    mdb::MultiEnumField field(mdb::FieldDescriptor("tags", mdb::FieldType::MultiEnum));

    EXPECT_TRUE(field.setValue(mdb::json::array({"a", "b"})));
    EXPECT_FALSE(field.setValue("a"));
    EXPECT_FALSE(field.setValue(mdb::json::array({"a", 1})));
}

TEST(Fields, RejectedValueKeepsPrevious) {
    const mdb::ValidationRuleFactory rules;
    mdb::FieldDescriptor descriptor("email", mdb::FieldType::Email);
    descriptor.setRequired(true);

    mdb::EmailField field(descriptor);
    field.setUpValidationRules(rules);

    ASSERT_TRUE(field.setValue("jane@example.com"));
    EXPECT_FALSE(field.setValue("not-an-email"));
    EXPECT_EQ(field.value(), "jane@example.com");
    EXPECT_FALSE(field.validationErrors().empty());

    EXPECT_FALSE(field.setValue(nullptr));
    EXPECT_EQ(field.value(), "jane@example.com");
}

TEST(Fields, ImpliedRules) {
    const mdb::ValidationRuleFactory rules;
    const mdb::FieldFactory factory;

    const auto expect_rules = [&](mdb::FieldDescriptor descriptor, const std::vector<std::string> &expected) {
        auto field = factory.create(descriptor);
        field->setUpValidationRules(rules);
        EXPECT_EQ(ruleNames(*field), expected) << descriptor.name();
    };

    expect_rules(mdb::FieldDescriptor("email", mdb::FieldType::Email), {"Email"});
    expect_rules(mdb::FieldDescriptor("born", mdb::FieldType::Date), {"DateTime"});
    expect_rules(mdb::FieldDescriptor("seen_at", mdb::FieldType::DateTime), {"DateTime"});
    expect_rules(mdb::FieldDescriptor("genre", mdb::FieldType::Enum), {"Options"});
    expect_rules(mdb::FieldDescriptor("tags", mdb::FieldType::MultiEnum), {"Options"});
    expect_rules(mdb::FieldDescriptor("size", mdb::FieldType::RadioButtonSet), {"Options"});
    expect_rules(mdb::FieldDescriptor("trailer", mdb::FieldType::Video), {"VideoURL"});
    expect_rules(mdb::FieldDescriptor("title", mdb::FieldType::Text), {});

    mdb::FieldDescriptor required_email("email", mdb::FieldType::Email);
    required_email.setRequired(true).setValidationRules({"Email", "Unique"});
    expect_rules(required_email, {"Required", "Email", "Unique"});
}

TEST(Fields, UnknownRuleIsSkipped) {
    const mdb::ValidationRuleFactory rules;
    mdb::FieldDescriptor descriptor("title", mdb::FieldType::Text);
    descriptor.setValidationRules({"Telepathy", "Alphanumeric"});

    mdb::TextField field(descriptor);
    field.setUpValidationRules(rules);

    EXPECT_EQ(ruleNames(field), std::vector<std::string>{"Alphanumeric"});
}

TEST(Fields, ValidateRunsStorageRules) {
    const mdb::ValidationRuleFactory rules;
    mdb::FieldDescriptor descriptor("title", mdb::FieldType::Text);
    descriptor.setRequired(true);

    mdb::TextField field(descriptor);
    field.setUpValidationRules(rules);

    const auto errors = field.validate(mdb::RuleContext{descriptor});
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(field.validationErrors(), errors);

    field.setValueFromTrustedSource("Heat");
    EXPECT_TRUE(field.validate(mdb::RuleContext{descriptor}).empty());
}

TEST(Fields, Operators) {
    const mdb::FieldFactory factory;

    const auto password = factory.create(mdb::FieldDescriptor("password", mdb::FieldType::Password));
    EXPECT_EQ(password->operators(), (std::vector<std::string>{"isNull", "isNotNull"}));

    const auto image = factory.create(mdb::FieldDescriptor("poster", mdb::FieldType::Image));
    EXPECT_EQ(image->operators(), mdb::baseOperators());

    const auto text = factory.create(mdb::FieldDescriptor("title", mdb::FieldType::Text));
    const auto ops = text->operators();
    EXPECT_NE(std::ranges::find(ops, "contains"), ops.end());

    mdb::FieldDescriptor declared("title", mdb::FieldType::Text);
    declared.setOperators({"equals"});
    EXPECT_EQ(factory.create(declared)->operators(), std::vector<std::string>{"equals"});
}

TEST(Fields, ToJSONAddsComponentAndOperators) {
    const mdb::FieldFactory factory;
    const auto field = factory.create(mdb::FieldDescriptor("released", mdb::FieldType::DateTime));

    const auto data = field->toJSON();
    EXPECT_EQ(data["name"], "released");
    EXPECT_EQ(data["reactComponent"], "DateTimePicker");
    EXPECT_TRUE(data["operators"].is_array());
}
