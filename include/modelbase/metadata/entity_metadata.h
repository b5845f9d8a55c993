/**
 * @file entity_metadata.h
 * @brief Resolved schema of one entity, as cached by the MetadataEngine.
 *
 * Entity schema files are JSON objects:
 *
 * @code
 * {
 *   "name": "Movies",
 *   "table": "movies",
 *   "extends": "Content",
 *   "fields": { "title": { "type": "Text", "required": true } },
 *   "relationships": ["movies_movie_quotes"],
 *   "searchableFields": ["title"],
 *   "pagination": { "defaultPageSize": 20 }
 * }
 * @endcode
 *
 * `relationships` is either a list of standalone relationship names or an object
 * keyed by name holding inline relationship definitions.
 */

#ifndef MODELBASE_ENTITY_METADATA_H
#define MODELBASE_ENTITY_METADATA_H

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "field_descriptor.h"

namespace mdb {
    struct SortSpec {
        std::string field;
        std::string direction = "asc";

        bool operator==(const SortSpec &) const = default;
    };

    struct PaginationConfig {
        int defaultPageSize = 20;
        int maxPageSize = 1000;
        std::vector<int> pageSizeOptions = {10, 20, 50, 100, 200, 500, 1000};

        bool operator==(const PaginationConfig &) const = default;

        [[nodiscard]] nlohmann::ordered_json toJSON() const;

        /// Missing keys keep their defaults.
        static PaginationConfig fromJSON(const nlohmann::ordered_json &data);
    };

    class EntityMetadata {
    public:
        EntityMetadata() = default;

        explicit EntityMetadata(const std::string &entity_name);

        /**
         * @brief Build from a parsed schema file.
         * @throws SchemaError if `name` is missing or a field entry is malformed.
         */
        static EntityMetadata fromJSON(const nlohmann::ordered_json &data);

        bool operator==(const EntityMetadata &other) const;

        [[nodiscard]] const std::string &name() const;

        EntityMetadata &setName(const std::string &name);

        /// Backing table, lowercased name when not declared.
        [[nodiscard]] std::string table() const;

        EntityMetadata &setTable(const std::string &table);

        [[nodiscard]] const std::string &description() const;

        EntityMetadata &setDescription(const std::string &description);

        /// Parent entity class from `extends`, empty if none.
        [[nodiscard]] const std::string &parent() const;

        EntityMetadata &setParent(const std::string &parent);

        [[nodiscard]] const FieldList &fields() const;

        [[nodiscard]] const FieldDescriptor *field(const std::string &field_name) const;

        [[nodiscard]] bool hasField(const std::string &field_name) const;

        /// Add or replace a field in place.
        EntityMetadata &addField(const FieldDescriptor &field);

        /// Mutable access, used while resolving dynamic options.
        FieldList &mutableFields();

        /**
         * @brief Put `core` in front of the entity's own fields.
         *
         * A field declared by the entity replaces the same-named core field in
         * place, so core fields keep their leading position.
         */
        void mergeCoreFields(const FieldList &core);

        /// Names of all relationships, standalone and inline.
        [[nodiscard]] const std::vector<std::string> &relationshipNames() const;

        EntityMetadata &addRelationshipName(const std::string &name);

        /// Inline relationship definitions keyed by name, an empty object if none.
        [[nodiscard]] const nlohmann::ordered_json &inlineRelationships() const;

        EntityMetadata &addInlineRelationship(const std::string &name, const nlohmann::ordered_json &definition);

        /// Declared searchable fields, else the Text, BigText and Email storage fields.
        [[nodiscard]] std::vector<std::string> searchableFields() const;

        /// Declared sortable fields, else storage fields of orderable types.
        [[nodiscard]] std::vector<std::string> sortableFields() const;

        /// Declared default sort, else ascending by `id`.
        [[nodiscard]] std::vector<SortSpec> defaultSort() const;

        [[nodiscard]] const PaginationConfig &pagination() const;

        EntityMetadata &setPagination(const PaginationConfig &pagination);

        /// UI hints, kept verbatim; `null` if none.
        [[nodiscard]] const nlohmann::ordered_json &ui() const;

        [[nodiscard]] nlohmann::ordered_json toJSON() const;

        /**
         * @brief Check name, field uniqueness and each field descriptor.
         * @return Error message of the first problem found.
         */
        [[nodiscard]] std::optional<std::string> validate() const;

        /// `{name, table, description, fieldCount, relationshipCount}`
        [[nodiscard]] nlohmann::ordered_json summary() const;

    private:
        std::string m_name, m_table, m_description, m_parent;
        FieldList m_fields;
        std::vector<std::string> m_relationshipNames;
        nlohmann::ordered_json m_inlineRelationships = nlohmann::ordered_json::object();
        std::optional<std::vector<std::string>> m_searchable, m_sortable;
        std::optional<std::vector<SortSpec>> m_defaultSort;
        PaginationConfig m_pagination;
        nlohmann::ordered_json m_ui = nullptr;
    };
} // mdb

#endif //MODELBASE_ENTITY_METADATA_H
