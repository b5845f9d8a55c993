#include "../../include/modelbase/metadata/field_descriptor.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    namespace {
        struct FieldTypeName {
            FieldType type;
            const char *name;
        };

        constexpr FieldTypeName fieldTypeNames[] = {
            {FieldType::ID, "ID"},
            {FieldType::Text, "Text"},
            {FieldType::BigText, "BigText"},
            {FieldType::Email, "Email"},
            {FieldType::Integer, "Integer"},
            {FieldType::Float, "Float"},
            {FieldType::Boolean, "Boolean"},
            {FieldType::Date, "Date"},
            {FieldType::DateTime, "DateTime"},
            {FieldType::Enum, "Enum"},
            {FieldType::MultiEnum, "MultiEnum"},
            {FieldType::RelatedRecord, "RelatedRecord"},
            {FieldType::Image, "Image"},
            {FieldType::Video, "Video"},
            {FieldType::Password, "Password"},
            {FieldType::RadioButtonSet, "RadioButtonSet"},
        };

        bool readBool(const nlohmann::ordered_json &schema, const char *key) {
            if (!schema[key].is_boolean())
                throw SchemaError(std::format("Expected a bool for field property `{}`.", key));
            return schema[key].get<bool>();
        }

        std::string readString(const nlohmann::ordered_json &schema, const char *key) {
            if (schema[key].is_null()) return "";
            if (!schema[key].is_string())
                throw SchemaError(std::format("Expected a string for field property `{}`.", key));
            return schema[key].get<std::string>();
        }

        std::vector<std::string> readStringList(const nlohmann::ordered_json &schema, const char *key) {
            if (!schema[key].is_array())
                throw SchemaError(std::format("Expected an array of strings for field property `{}`.", key));

            std::vector<std::string> out;
            for (const auto &item: schema[key]) {
                if (!item.is_string())
                    throw SchemaError(std::format("Expected an array of strings for field property `{}`.", key));
                out.push_back(item.get<std::string>());
            }
            return out;
        }
    }

    std::string fieldTypeToString(const FieldType type) {
        for (const auto &[t, name]: fieldTypeNames) {
            if (t == type) return name;
        }
        return "Text";
    }

    std::optional<FieldType> fieldTypeFromString(const std::string &type) {
        auto name = trim(type);
        if (hasSuffix(name, "Field"))
            name = name.substr(0, name.size() - 5);

        for (const auto &[t, n]: fieldTypeNames) {
            if (name == n) return t;
        }
        return std::nullopt;
    }

    const std::vector<FieldType> &allFieldTypes() {
        static const std::vector<FieldType> types = [] {
            std::vector<FieldType> out;
            for (const auto &[t, _]: fieldTypeNames) out.push_back(t);
            return out;
        }();
        return types;
    }

    FieldDescriptor::FieldDescriptor(std::string field_name, const FieldType field_type)
        : m_name(std::move(field_name)),
          m_type(field_type) {
    }

    FieldDescriptor::FieldDescriptor(const nlohmann::ordered_json &field_schema) {
        if (!field_schema.is_object())
            throw SchemaError("Field definition must be a JSON object!");

        if (!field_schema.contains("name") || !field_schema["name"].is_string()
            || trim(field_schema["name"].get<std::string>()).empty())
            throw SchemaError("Field name is required!");

        if (!field_schema.contains("type") || !field_schema["type"].is_string()
            || field_schema["type"].get<std::string>().empty())
            throw SchemaError(std::format("Field type is required for field `{}`!",
                                          field_schema["name"].get<std::string>()));

        updateWith(field_schema);
    }

    bool FieldDescriptor::operator==(const FieldDescriptor &other) const {
        return toJSON() == other.toJSON();
    }

    const std::vector<std::string> &FieldDescriptor::knownKeys() {
        static const std::vector<std::string> keys = {
            "name", "type", "label", "description", "required", "readOnly", "unique",
            "isDBField", "isPrimaryKey", "nullable", "validationRules", "operators",
            "defaultValue", "relatedModel", "relatedFieldName", "displayFieldName",
            "options", "optionsProvider", "optionsClass", "optionsMethod"
        };
        return keys;
    }

    FieldDescriptor &FieldDescriptor::updateWith(const nlohmann::ordered_json &field_schema) {
        if (!field_schema.is_object())
            throw SchemaError("Field update must be a JSON object!");

        if (field_schema.contains("name")) {
            if (!field_schema["name"].is_string() || field_schema["name"].empty())
                throw SchemaError("Invalid field name provided!");

            setName(field_schema["name"].get<std::string>());
        }

        if (field_schema.contains("type")) {
            if (!field_schema["type"].is_string())
                throw SchemaError("Invalid field type provided!");

            const auto type_name = field_schema["type"].get<std::string>();
            const auto type = fieldTypeFromString(type_name);
            if (!type.has_value())
                throw SchemaError(std::format("Unsupported field type `{}` for field `{}`", type_name, m_name));

            setType(type.value());
        }

        if (field_schema.contains("label")) setLabel(readString(field_schema, "label"));
        if (field_schema.contains("description")) setDescription(readString(field_schema, "description"));

        if (field_schema.contains("required")) setRequired(readBool(field_schema, "required"));
        if (field_schema.contains("readOnly")) setReadOnly(readBool(field_schema, "readOnly"));
        if (field_schema.contains("unique")) setUnique(readBool(field_schema, "unique"));
        if (field_schema.contains("isDBField")) setIsDBField(readBool(field_schema, "isDBField"));
        if (field_schema.contains("isPrimaryKey")) setIsPrimaryKey(readBool(field_schema, "isPrimaryKey"));
        if (field_schema.contains("nullable")) setNullable(readBool(field_schema, "nullable"));

        if (field_schema.contains("validationRules"))
            setValidationRules(readStringList(field_schema, "validationRules"));

        if (field_schema.contains("operators"))
            setOperators(readStringList(field_schema, "operators"));

        if (field_schema.contains("defaultValue"))
            setDefaultValue(field_schema["defaultValue"]);

        if (field_schema.contains("relatedModel")) m_relatedModel = readString(field_schema, "relatedModel");
        if (field_schema.contains("relatedFieldName"))
            m_relatedFieldName = readString(field_schema, "relatedFieldName");
        if (field_schema.contains("displayFieldName"))
            m_displayFieldName = readString(field_schema, "displayFieldName");
        if (!m_relatedModel.empty() && m_relatedFieldName.empty())
            m_relatedFieldName = "id";

        if (field_schema.contains("options")) {
            const auto &opts = field_schema["options"];
            if (!(opts.is_object() || opts.is_array() || opts.is_null()))
                throw SchemaError(std::format("Expected an object, array or null for `options` of `{}`.", m_name));

            setOptions(opts);
        }

        if (field_schema.contains("optionsProvider")) {
            setOptionsProvider(readString(field_schema, "optionsProvider"));
        } else if (field_schema.contains("optionsClass") && field_schema.contains("optionsMethod")) {
            // Legacy pair form, joined as `Class::method`
            setOptionsProvider(readString(field_schema, "optionsClass") + "::"
                               + readString(field_schema, "optionsMethod"));
        }

        const auto &known = knownKeys();
        for (const auto &[key, value]: field_schema.items()) {
            if (std::ranges::find(known, key) == known.end())
                m_extras[key] = value;
        }

        return *this;
    }

    const std::string &FieldDescriptor::name() const { return m_name; }

    FieldDescriptor &FieldDescriptor::setName(const std::string &name) {
        if (trim(name).empty())
            throw SchemaError("Field name is required!");

        m_name = trim(name);
        return *this;
    }

    FieldType FieldDescriptor::type() const { return m_type; }

    std::string FieldDescriptor::typeName() const { return fieldTypeToString(m_type); }

    FieldDescriptor &FieldDescriptor::setType(const FieldType type) {
        m_type = type;
        return *this;
    }

    const std::string &FieldDescriptor::label() const { return m_label; }

    FieldDescriptor &FieldDescriptor::setLabel(const std::string &label) {
        m_label = label;
        return *this;
    }

    const std::string &FieldDescriptor::description() const { return m_description; }

    FieldDescriptor &FieldDescriptor::setDescription(const std::string &description) {
        m_description = description;
        return *this;
    }

    bool FieldDescriptor::required() const { return m_required; }

    FieldDescriptor &FieldDescriptor::setRequired(const bool required) {
        m_required = required;
        return *this;
    }

    bool FieldDescriptor::readOnly() const { return m_readOnly; }

    FieldDescriptor &FieldDescriptor::setReadOnly(const bool read_only) {
        m_readOnly = read_only;
        return *this;
    }

    bool FieldDescriptor::unique() const { return m_unique; }

    FieldDescriptor &FieldDescriptor::setUnique(const bool unique) {
        m_unique = unique;
        return *this;
    }

    bool FieldDescriptor::isDBField() const { return m_isDBField; }

    FieldDescriptor &FieldDescriptor::setIsDBField(const bool db_field) {
        m_isDBField = db_field;
        return *this;
    }

    bool FieldDescriptor::isPrimaryKey() const { return m_primaryKey; }

    FieldDescriptor &FieldDescriptor::setIsPrimaryKey(const bool pk) {
        m_primaryKey = pk;
        return *this;
    }

    bool FieldDescriptor::nullable() const { return m_nullable; }

    FieldDescriptor &FieldDescriptor::setNullable(const bool nullable) {
        m_nullable = nullable;
        return *this;
    }

    const std::vector<std::string> &FieldDescriptor::validationRules() const { return m_validationRules; }

    FieldDescriptor &FieldDescriptor::setValidationRules(const std::vector<std::string> &rules) {
        m_validationRules = rules;
        return *this;
    }

    const std::optional<std::vector<std::string>> &FieldDescriptor::operators() const { return m_operators; }

    FieldDescriptor &FieldDescriptor::setOperators(const std::vector<std::string> &operators) {
        m_operators = operators;
        return *this;
    }

    const nlohmann::ordered_json &FieldDescriptor::defaultValue() const { return m_defaultValue; }

    FieldDescriptor &FieldDescriptor::setDefaultValue(const nlohmann::ordered_json &value) {
        m_defaultValue = value;
        return *this;
    }

    const std::string &FieldDescriptor::relatedModel() const { return m_relatedModel; }

    const std::string &FieldDescriptor::relatedFieldName() const { return m_relatedFieldName; }

    const std::string &FieldDescriptor::displayFieldName() const { return m_displayFieldName; }

    FieldDescriptor &FieldDescriptor::setRelatedModel(const std::string &model,
                                                      const std::string &field_name,
                                                      const std::string &display_field) {
        m_relatedModel = model;
        m_relatedFieldName = field_name;
        m_displayFieldName = display_field;
        return *this;
    }

    const nlohmann::ordered_json &FieldDescriptor::options() const { return m_options; }

    FieldDescriptor &FieldDescriptor::setOptions(const nlohmann::ordered_json &options) {
        m_options = options;
        return *this;
    }

    const std::string &FieldDescriptor::optionsProvider() const { return m_optionsProvider; }

    FieldDescriptor &FieldDescriptor::setOptionsProvider(const std::string &provider) {
        m_optionsProvider = provider;
        return *this;
    }

    const nlohmann::ordered_json &FieldDescriptor::extras() const { return m_extras; }

    nlohmann::ordered_json FieldDescriptor::extra(const std::string &key, const nlohmann::ordered_json &fallback) const {
        if (m_extras.contains(key)) return m_extras[key];
        return fallback;
    }

    FieldDescriptor &FieldDescriptor::setExtra(const std::string &key, const nlohmann::ordered_json &value) {
        m_extras[key] = value;
        return *this;
    }

    nlohmann::ordered_json FieldDescriptor::toJSON() const {
        nlohmann::ordered_json out = m_extras;
        out["name"] = m_name;
        out["type"] = typeName();
        out["label"] = m_label;
        out["required"] = m_required;
        out["readOnly"] = m_readOnly;
        out["unique"] = m_unique;
        out["isDBField"] = m_isDBField;
        out["isPrimaryKey"] = m_primaryKey;
        out["nullable"] = m_nullable;
        out["validationRules"] = m_validationRules;

        if (!m_description.empty()) out["description"] = m_description;
        if (m_operators.has_value()) out["operators"] = m_operators.value();
        if (!m_defaultValue.is_null()) out["defaultValue"] = m_defaultValue;

        if (!m_relatedModel.empty()) {
            out["relatedModel"] = m_relatedModel;
            out["relatedFieldName"] = m_relatedFieldName;
        }
        if (!m_displayFieldName.empty()) out["displayFieldName"] = m_displayFieldName;

        if (!m_options.is_null()) out["options"] = m_options;
        if (!m_optionsProvider.empty()) out["optionsProvider"] = m_optionsProvider;

        return out;
    }

    std::optional<std::string> FieldDescriptor::validate() const {
        if (m_name.empty()) return "Field name is empty";

        if (m_type == FieldType::RelatedRecord && m_relatedModel.empty())
            return std::format("RelatedRecord field `{}` has no `relatedModel`", m_name);

        if (m_required && m_nullable)
            return std::format("Field `{}` can't be both required and nullable", m_name);

        return std::nullopt;
    }

    const FieldDescriptor *findField(const FieldList &fields, const std::string &name) {
        const auto it = std::ranges::find_if(fields, [&](const FieldDescriptor &f) { return f.name() == name; });
        return it == fields.end() ? nullptr : &*it;
    }

    FieldDescriptor *findField(FieldList &fields, const std::string &name) {
        const auto it = std::ranges::find_if(fields, [&](const FieldDescriptor &f) { return f.name() == name; });
        return it == fields.end() ? nullptr : &*it;
    }

    void mergeFields(FieldList &base, const FieldList &overlay) {
        for (const auto &field: overlay) {
            if (auto *existing = findField(base, field.name())) {
                *existing = field;
            } else {
                base.push_back(field);
            }
        }
    }

    FieldList fieldsFromJSON(const nlohmann::ordered_json &fields) {
        FieldList out;
        if (fields.is_null()) return out;

        if (fields.is_object()) {
            for (const auto &[key, value]: fields.items()) {
                if (!value.is_object())
                    throw SchemaError(std::format("Field `{}` must be a JSON object", key));

                auto schema = value;
                if (!schema.contains("name")) schema["name"] = key;
                mergeFields(out, {FieldDescriptor(schema)});
            }
            return out;
        }

        if (fields.is_array()) {
            for (const auto &value: fields) {
                FieldDescriptor field(value);
                if (findField(out, field.name()) != nullptr)
                    throw SchemaError(std::format("Duplicate field `{}`", field.name()));
                out.push_back(std::move(field));
            }
            return out;
        }

        throw SchemaError("Expected `fields` to be an object or an array");
    }

    nlohmann::ordered_json fieldsToJSON(const FieldList &fields) {
        auto out = nlohmann::ordered_json::array();
        for (const auto &field: fields) {
            out.push_back(field.toJSON());
        }
        return out;
    }
} // mdb
