/**
 * @file field_descriptor.h
 * @brief Declarative description of a single entity field.
 *
 * A field descriptor is what schema files contain for each field: its type,
 * flags, validation rule names and UI hints. Typed runtime fields are built
 * from descriptors by the FieldFactory.
 */

#ifndef MODELBASE_FIELD_DESCRIPTOR_H
#define MODELBASE_FIELD_DESCRIPTOR_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mdb {
    /**
     * @brief Closed set of field types understood by the framework.
     */
    enum class FieldType : uint8_t {
        ID = 0,
        Text,
        BigText,
        Email,
        Integer,
        Float,
        Boolean,
        Date,
        DateTime,
        Enum,
        MultiEnum,
        RelatedRecord,
        Image,
        Video,
        Password,
        RadioButtonSet
    };

    /// Short name of a field type, e.g. `DateTime`.
    std::string fieldTypeToString(FieldType type);

    /**
     * @brief Parse a field type name.
     *
     * Both the short form (`DateTime`) and the class form (`DateTimeField`) are accepted.
     *
     * @return Parsed type, `std::nullopt` for unknown names.
     */
    std::optional<FieldType> fieldTypeFromString(const std::string &type);

    /// All field types in declaration order.
    const std::vector<FieldType> &allFieldTypes();

    /**
     * @brief Represents a single field in an entity or relationship schema.
     *
     * @code
     * FieldDescriptor title("title", FieldType::Text);
     * title.setLabel("Title").setRequired(true).setValidationRules({"Required"});
     *
     * FieldDescriptor fromFile(json{{"name", "email"}, {"type", "EmailField"}});
     * @endcode
     */
    class FieldDescriptor {
    public:
        FieldDescriptor() = default;

        FieldDescriptor(std::string field_name, FieldType field_type);

        /**
         * @brief Construct a field descriptor from a schema object.
         * @param field_schema JSON object, requires a `name` and a known `type`.
         * @throws SchemaError if `name` or `type` is missing or invalid.
         */
        explicit FieldDescriptor(const nlohmann::ordered_json &field_schema);

        bool operator==(const FieldDescriptor &other) const;

        // ----------------- DESCRIPTOR PROPERTIES ---------------------- //

        [[nodiscard]] const std::string &name() const;

        FieldDescriptor &setName(const std::string &name);

        [[nodiscard]] FieldType type() const;

        /// Short type name, e.g. `Text`.
        [[nodiscard]] std::string typeName() const;

        FieldDescriptor &setType(FieldType type);

        [[nodiscard]] const std::string &label() const;

        FieldDescriptor &setLabel(const std::string &label);

        [[nodiscard]] const std::string &description() const;

        FieldDescriptor &setDescription(const std::string &description);

        [[nodiscard]] bool required() const;

        FieldDescriptor &setRequired(bool required);

        [[nodiscard]] bool readOnly() const;

        FieldDescriptor &setReadOnly(bool read_only);

        [[nodiscard]] bool unique() const;

        FieldDescriptor &setUnique(bool unique);

        /**
         * @brief Whether the field is backed by a storage column.
         *
         * Display-only fields like `created_by_name` are not.
         */
        [[nodiscard]] bool isDBField() const;

        FieldDescriptor &setIsDBField(bool db_field);

        [[nodiscard]] bool isPrimaryKey() const;

        FieldDescriptor &setIsPrimaryKey(bool pk);

        [[nodiscard]] bool nullable() const;

        FieldDescriptor &setNullable(bool nullable);

        /// Validation rule names, e.g. `{"Required", "Email"}`.
        [[nodiscard]] const std::vector<std::string> &validationRules() const;

        FieldDescriptor &setValidationRules(const std::vector<std::string> &rules);

        /**
         * @brief Filter operators declared in the schema.
         *
         * When not declared, the field implementation supplies its defaults.
         */
        [[nodiscard]] const std::optional<std::vector<std::string>> &operators() const;

        FieldDescriptor &setOperators(const std::vector<std::string> &operators);

        [[nodiscard]] const nlohmann::ordered_json &defaultValue() const;

        FieldDescriptor &setDefaultValue(const nlohmann::ordered_json &value);

        [[nodiscard]] const std::string &relatedModel() const;

        [[nodiscard]] const std::string &relatedFieldName() const;

        [[nodiscard]] const std::string &displayFieldName() const;

        /**
         * @brief Point this field at a record of another entity.
         * @param model Related entity name
         * @param field_name Referenced field, `id` by default
         * @param display_field Field holding a display value for the relation
         */
        FieldDescriptor &setRelatedModel(const std::string &model,
                                         const std::string &field_name = "id",
                                         const std::string &display_field = "");

        /**
         * @brief Static options for Enum, MultiEnum and RadioButtonSet fields.
         *
         * Either an object `{value: label}` or an array of values; `null` when unset.
         */
        [[nodiscard]] const nlohmann::ordered_json &options() const;

        FieldDescriptor &setOptions(const nlohmann::ordered_json &options);

        /// Name of the dynamic options provider, empty if none.
        [[nodiscard]] const std::string &optionsProvider() const;

        FieldDescriptor &setOptionsProvider(const std::string &provider);

        /// Keys not modelled above (maxLength, placeholder, ...), kept verbatim.
        [[nodiscard]] const nlohmann::ordered_json &extras() const;

        [[nodiscard]] nlohmann::ordered_json extra(const std::string &key, const nlohmann::ordered_json &fallback = nullptr) const;

        FieldDescriptor &setExtra(const std::string &key, const nlohmann::ordered_json &value);

        // ----------------- DESCRIPTOR OPS ---------------------- //

        /**
         * @brief Update descriptor with new JSON data.
         *
         * Only keys present in `field_schema` are touched.
         *
         * @param field_schema JSON object with field updates
         * @return Reference to self for chaining
         * @throws SchemaError for values of the wrong JSON kind.
         */
        FieldDescriptor &updateWith(const nlohmann::ordered_json &field_schema);

        /**
         * @brief Convert descriptor to JSON, the inverse of the JSON constructor.
         */
        [[nodiscard]] nlohmann::ordered_json toJSON() const;

        /**
         * @brief Validate field definition.
         * @return Optional error message if validation fails
         */
        [[nodiscard]] std::optional<std::string> validate() const;

        /// Keys handled by `updateWith` itself, everything else lands in `extras()`.
        static const std::vector<std::string> &knownKeys();

    private:
        std::string m_name, m_label, m_description;
        FieldType m_type = FieldType::Text;
        bool m_required = false, m_readOnly = false, m_unique = false,
             m_isDBField = true, m_primaryKey = false, m_nullable = false;
        std::vector<std::string> m_validationRules;
        std::optional<std::vector<std::string>> m_operators;
        nlohmann::ordered_json m_defaultValue = nullptr;

        std::string m_relatedModel, m_relatedFieldName, m_displayFieldName;

        nlohmann::ordered_json m_options = nullptr;
        std::string m_optionsProvider;

        nlohmann::ordered_json m_extras = nlohmann::ordered_json::object();
    };

    /// Ordered collection of field descriptors, unique by name.
    using FieldList = std::vector<FieldDescriptor>;

    /// Find a field by name, `nullptr` if absent.
    const FieldDescriptor *findField(const FieldList &fields, const std::string &name);

    FieldDescriptor *findField(FieldList &fields, const std::string &name);

    /**
     * @brief Merge `overlay` into `base`.
     *
     * A field of `overlay` replaces the same-named field of `base` in place,
     * new names are appended in `overlay` order.
     */
    void mergeFields(FieldList &base, const FieldList &overlay);

    /**
     * @brief Parse a field collection from JSON.
     *
     * Accepts an object keyed by field name (the key fills in a missing `name`)
     * or an array of field objects. Object form yields fields in key order,
     * array form keeps the declared order.
     *
     * @throws SchemaError for malformed entries.
     */
    FieldList fieldsFromJSON(const nlohmann::ordered_json &fields);

    /// Serialize fields as an array, keeping order.
    nlohmann::ordered_json fieldsToJSON(const FieldList &fields);
} // mdb

#endif //MODELBASE_FIELD_DESCRIPTOR_H
