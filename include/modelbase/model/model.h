/**
 * @file model.h
 * @brief Runtime instance of an entity backed by cached metadata.
 *
 * Typed fields and relationship handles are built lazily from the engine's
 * metadata on first access. Persistence goes through the DatabaseConnector.
 *
 * @code
 * ModelContext ctx{engine, db, [] { return std::string("u-1"); }};
 * Model movie(ctx, "Movies");
 * movie.set("title", "Heat");
 * if (!movie.create())
 *     logger::warn("Invalid movie: {}", movie.validationErrors().dump());
 * @endcode
 */

#ifndef MODELBASE_MODEL_H
#define MODELBASE_MODEL_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model_context.h"
#include "relationship.h"
#include "../core/database_connector.h"
#include "../fields/field_base.h"
#include "../metadata/metadata_engine.h"

namespace mdb {
    class Model final : public Persistable {
    public:
        /**
         * @brief Bind a model to the cached metadata of `entity_name`.
         * @throws NotFoundError if the entity is unknown.
         */
        Model(ModelContext ctx, const std::string &entity_name);

        Model(const Model &) = delete;

        Model &operator=(const Model &) = delete;

        // ----------------- PERSISTABLE ---------------------- //

        [[nodiscard]] std::string name() const override;

        [[nodiscard]] std::string tableName() const override;

        [[nodiscard]] const FieldList &fieldDescriptors() const override;

        [[nodiscard]] json get(const std::string &field_name) const override;

        [[nodiscard]] Record values() const override;

        // ----------------- FIELDS ---------------------- //

        [[nodiscard]] const EntityMetadata &metadata() const;

        /// Typed fields in metadata order; a field that fails to build is left out.
        const std::vector<std::unique_ptr<FieldBase>> &fields() const;

        /// `nullptr` if there is no such field.
        [[nodiscard]] FieldBase *field(const std::string &field_name) const;

        [[nodiscard]] bool hasField(const std::string &field_name) const;

        /**
         * @brief Set a field value after validating it.
         * @return `false` if the field is unknown or the value was rejected; the
         * previous value is kept.
         */
        bool set(const std::string &field_name, const json &value);

        /// Load a stored row without validation.
        void populateFromRow(const Record &row);

        /// All field values, display-only fields included.
        [[nodiscard]] json toJSON() const;

        /**
         * @brief Run every field's validation rules against the current values.
         *
         * Storage-backed rules (Unique, ForeignKeyExists) query the connector.
         */
        bool validate();

        /// `{field: [errors]}` of the last validation, failing fields only.
        [[nodiscard]] json validationErrors() const;

        // ----------------- PERSISTENCE ---------------------- //

        /// Assign an id and audit fields, validate and insert.
        bool create();

        /// Stamp update audit fields, validate and update.
        bool update();

        bool softDelete();

        bool hardDelete();

        /// Clear the soft-delete markers and update.
        bool restore();

        /**
         * @brief Delete the record, honouring relationship cascade policies.
         *
         * Each relationship handles the deletion first, with `action` or its own
         * `cascadeOnDelete`. The record is soft deleted only if all of them agree.
         *
         * @throws ConstraintError if a restrict policy blocks the deletion.
         */
        bool remove(std::optional<CascadeAction> action = std::nullopt);

        [[nodiscard]] bool isDeleted() const;

        // ----------------- RELATIONSHIPS ---------------------- //

        /// Relationship handles of this entity; one that fails to resolve is left out.
        const std::vector<std::unique_ptr<Relationship>> &relationships() const;

        /// `nullptr` if this entity has no such relationship.
        [[nodiscard]] Relationship *relationship(const std::string &rel_name) const;

        bool addRelation(const std::string &rel_name, const Model &other, const json &extra = json::object());

        bool removeRelation(const std::string &rel_name, const Model &other);

        bool hasRelation(const std::string &rel_name, const Model &other);

        /// Active rows of `rel_name` referencing this record.
        Records related(const std::string &rel_name);

        // ----------------- LISTING ---------------------- //

        [[nodiscard]] FieldNames searchableFields() const;

        [[nodiscard]] FieldNames sortableFields() const;

        [[nodiscard]] std::vector<SortSpec> defaultSort() const;

        [[nodiscard]] const PaginationConfig &pagination() const;

    private:
        void ensureFields() const;

        void ensureRelationships() const;

        Relationship &requireRelationship(const std::string &rel_name) const;

        RuleContext ruleContext(const FieldBase &field) const;

        void stampCreated();

        void stampUpdated();

        ModelContext m_ctx;
        EntityMetadataPtr m_metadata;

        mutable std::vector<std::unique_ptr<FieldBase>> m_fields;
        mutable bool m_fieldsBuilt = false;
        mutable std::vector<std::unique_ptr<Relationship>> m_relationships;
        mutable bool m_relationshipsBuilt = false;

        json m_errors = json::object();
    };
} // mdb

#endif //MODELBASE_MODEL_H
