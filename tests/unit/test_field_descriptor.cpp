#include <gtest/gtest.h>

#include "modelbase/core/exceptions.h"
#include "modelbase/metadata/field_descriptor.h"
#include "modelbase/utils/utils.h"

TEST(FieldDescriptor, BasicConstructor) {
    mdb::FieldDescriptor field("title", mdb::FieldType::Text);

    EXPECT_EQ(field.name(), "title");
    EXPECT_EQ(field.type(), mdb::FieldType::Text);
    EXPECT_EQ(field.typeName(), "Text");
    EXPECT_FALSE(field.required());
    EXPECT_FALSE(field.readOnly());
    EXPECT_FALSE(field.unique());
    EXPECT_TRUE(field.isDBField());
    EXPECT_FALSE(field.isPrimaryKey());
    EXPECT_TRUE(field.validationRules().empty());
    EXPECT_FALSE(field.operators().has_value());
    EXPECT_TRUE(field.defaultValue().is_null());
}

TEST(FieldDescriptor, FluentSetters) {
    mdb::FieldDescriptor field("email", mdb::FieldType::Email);
    field.setLabel("Email").setRequired(true).setUnique(true).setValidationRules({"Required", "Email"});

    EXPECT_EQ(field.label(), "Email");
    EXPECT_TRUE(field.required());
    EXPECT_TRUE(field.unique());
    ASSERT_EQ(field.validationRules().size(), 2);
    EXPECT_EQ(field.validationRules()[1], "Email");
}

TEST(FieldDescriptor, FromJSON) {
    const mdb::json schema = {
        {"name", "created_by"},
        {"type", "RelatedRecordField"},
        {"label", "Created By"},
        {"readOnly", true},
        {"relatedModel", "Users"},
        {"displayFieldName", "created_by_name"},
        {"placeholder", "Pick a user"}
    };

    const mdb::FieldDescriptor field(schema);

    EXPECT_EQ(field.name(), "created_by");
    EXPECT_EQ(field.type(), mdb::FieldType::RelatedRecord);
    EXPECT_TRUE(field.readOnly());
    EXPECT_EQ(field.relatedModel(), "Users");
    EXPECT_EQ(field.relatedFieldName(), "id");
    EXPECT_EQ(field.displayFieldName(), "created_by_name");
    EXPECT_EQ(field.extra("placeholder"), "Pick a user");
    EXPECT_TRUE(field.extra("missing").is_null());
}

TEST(FieldDescriptor, FromJSONRejectsMalformed) {
    EXPECT_THROW((void) mdb::FieldDescriptor(mdb::json::array()), mdb::SchemaError);
    EXPECT_THROW((void) mdb::FieldDescriptor(mdb::json{{"type", "Text"}}), mdb::SchemaError);
    EXPECT_THROW((void) mdb::FieldDescriptor(mdb::json{{"name", "x"}}), mdb::SchemaError);
    EXPECT_THROW((void) mdb::FieldDescriptor(mdb::json{{"name", "x"}, {"type", "Bogus"}}), mdb::SchemaError);
    EXPECT_THROW((void) mdb::FieldDescriptor(mdb::json{{"name", "x"}, {"type", "Text"}, {"required", "yes"}}),
                 mdb::SchemaError);
    EXPECT_THROW((void) mdb::FieldDescriptor(mdb::json{{"name", "x"}, {"type", "Enum"}, {"options", "a,b"}}),
                 mdb::SchemaError);
}

TEST(FieldDescriptor, LegacyOptionsClassAndMethod) {
    const mdb::FieldDescriptor field(mdb::json{
        {"name", "user_type"},
        {"type", "Enum"},
        {"optionsClass", "Users"},
        {"optionsMethod", "getUserTypes"}
    });

    EXPECT_EQ(field.optionsProvider(), "Users::getUserTypes");
}

TEST(FieldDescriptor, UpdateWithTouchesOnlyGivenKeys) {
    mdb::FieldDescriptor field("title", mdb::FieldType::Text);
    field.setLabel("Title").setRequired(true);

    field.updateWith({{"label", "Movie Title"}});

    EXPECT_EQ(field.label(), "Movie Title");
    EXPECT_TRUE(field.required());
    EXPECT_EQ(field.type(), mdb::FieldType::Text);
}

TEST(FieldDescriptor, ToJSONRoundTrip) {
    mdb::FieldDescriptor field("genre", mdb::FieldType::Enum);
    field.setLabel("Genre")
            .setOptions({{"drama", "Drama"}})
            .setOperators({"equals", "in"})
            .setDefaultValue("drama")
            .setExtra("placeholder", "Pick one");

    const auto data = field.toJSON();
    EXPECT_EQ(data["type"], "Enum");
    EXPECT_EQ(data["placeholder"], "Pick one");
    EXPECT_EQ(data["options"]["drama"], "Drama");

    EXPECT_EQ(mdb::FieldDescriptor(data), field);
}

TEST(FieldDescriptor, Validate) {
    EXPECT_FALSE(mdb::FieldDescriptor("title", mdb::FieldType::Text).validate().has_value());

    mdb::FieldDescriptor related("owner", mdb::FieldType::RelatedRecord);
    EXPECT_TRUE(related.validate().has_value());
    related.setRelatedModel("Users");
    EXPECT_FALSE(related.validate().has_value());

    mdb::FieldDescriptor contradictory("x", mdb::FieldType::Text);
    contradictory.setRequired(true).setNullable(true);
    EXPECT_TRUE(contradictory.validate().has_value());
}

TEST(FieldDescriptor, TypeNames) {
    EXPECT_EQ(mdb::fieldTypeFromString("DateTime"), mdb::FieldType::DateTime);
    EXPECT_EQ(mdb::fieldTypeFromString("DateTimeField"), mdb::FieldType::DateTime);
    EXPECT_FALSE(mdb::fieldTypeFromString("Bogus").has_value());
    EXPECT_EQ(mdb::fieldTypeToString(mdb::FieldType::RadioButtonSet), "RadioButtonSet");
    EXPECT_EQ(mdb::allFieldTypes().size(), 16);
}

TEST(FieldList, ObjectAndArrayForms) {
    const auto from_object = mdb::fieldsFromJSON({
        {"title", {{"type", "Text"}}},
        {"rating", {{"type", "Integer"}}}
    });
    ASSERT_EQ(from_object.size(), 2);
    EXPECT_NE(mdb::findField(from_object, "title"), nullptr);

    const auto from_array = mdb::fieldsFromJSON(mdb::json::array({
        {{"name", "b"}, {"type", "Text"}},
        {{"name", "a"}, {"type", "Text"}}
    }));
    ASSERT_EQ(from_array.size(), 2);
    EXPECT_EQ(from_array[0].name(), "b");
    EXPECT_EQ(from_array[1].name(), "a");

    EXPECT_TRUE(mdb::fieldsFromJSON(nullptr).empty());
    EXPECT_THROW((void) mdb::fieldsFromJSON("title"), mdb::SchemaError);
}

TEST(FieldList, DuplicateArrayEntriesThrow) {
    const auto fields = mdb::json::array({
        {{"name", "title"}, {"type", "Text"}},
        {{"name", "rating"}, {"type", "Integer"}},
        {{"name", "title"}, {"type", "BigText"}}
    });

    try {
        (void) mdb::fieldsFromJSON(fields);
        FAIL() << "Expected SchemaError";
    } catch (const mdb::SchemaError &e) {
        EXPECT_STREQ(e.what(), "Duplicate field `title`");
    }
}

TEST(FieldList, EnumOptionsKeepDeclaredOrder) {
    const mdb::FieldDescriptor genre(mdb::json::parse(R"({
        "name": "genre", "type": "Enum",
        "options": {"drama": "Drama", "comedy": "Comedy", "horror": "Horror"}
    })"));

    std::vector<std::string> keys;
    for (const auto &[key, label]: genre.options().items())
        keys.push_back(key);
    EXPECT_EQ(keys, (std::vector<std::string>{"drama", "comedy", "horror"}));
    EXPECT_EQ(genre.toJSON()["options"].begin().key(), "drama");
}

TEST(FieldList, MergeReplacesInPlace) {
    mdb::FieldList base{
        mdb::FieldDescriptor("id", mdb::FieldType::ID),
        mdb::FieldDescriptor("created_at", mdb::FieldType::DateTime)
    };

    mdb::FieldDescriptor relabelled("id", mdb::FieldType::ID);
    relabelled.setLabel("Movie ID");

    mdb::mergeFields(base, {relabelled, mdb::FieldDescriptor("title", mdb::FieldType::Text)});

    ASSERT_EQ(base.size(), 3);
    EXPECT_EQ(base[0].name(), "id");
    EXPECT_EQ(base[0].label(), "Movie ID");
    EXPECT_EQ(base[2].name(), "title");
}
