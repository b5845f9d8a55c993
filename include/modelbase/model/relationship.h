/**
 * @file relationship.h
 * @brief Runtime handle on one relationship table.
 *
 * A Relationship holds one row of its table at a time and performs the
 * lifecycle operations (link, unlink, cascade on deletion) through the
 * DatabaseConnector. Participants are passed as Persistable, their `name()`
 * selecting the key column and their `id` field providing the value.
 */

#ifndef MODELBASE_RELATIONSHIP_H
#define MODELBASE_RELATIONSHIP_H

#include <string>

#include <nlohmann/json.hpp>

#include "model_context.h"
#include "../core/database_connector.h"
#include "../metadata/metadata_engine.h"

namespace mdb {
    class Relationship final : public Persistable {
    public:
        Relationship(ModelContext ctx, RelationshipMetadataPtr metadata);

        // ----------------- PERSISTABLE ---------------------- //

        [[nodiscard]] std::string name() const override;

        [[nodiscard]] std::string tableName() const override;

        [[nodiscard]] const FieldList &fieldDescriptors() const override;

        [[nodiscard]] json get(const std::string &field_name) const override;

        [[nodiscard]] Record values() const override;

        // ----------------- ROW STATE ---------------------- //

        [[nodiscard]] const RelationshipMetadata &metadata() const;

        [[nodiscard]] RelationshipType type() const;

        [[nodiscard]] bool hasField(const std::string &field_name) const;

        /// Set a column of the current row, `false` for unknown fields.
        bool set(const std::string &field_name, const json &value);

        /// Replace the current row with the known columns of `row`.
        void populateFromRow(const Record &row);

        /// Forget the current row.
        void reset();

        // ----------------- LIFECYCLE ---------------------- //

        /// Key column referencing `model`, @see RelationshipResolver::modelIdField().
        [[nodiscard]] std::string modelIdField(const Persistable &model) const;

        /**
         * @brief The participant on the other side of `entity_name`.
         * @throws SchemaError if `entity_name` is not a participant.
         */
        [[nodiscard]] std::string otherModel(const std::string &entity_name) const;

        /// Active rows referencing `model`; at most one for OneToOne.
        Records relatedRecords(const Persistable &model);

        int activeRelatedCount(const Persistable &model);

        /**
         * @brief One page of active rows referencing `model`.
         * @return `{records, pagination: {current_page, per_page, total, has_more, total_pages}}`
         */
        json relatedPaginated(const Persistable &model, int page = 1, int per_page = 20);

        /// Whether an active row links `a` and `b`.
        bool has(const Persistable &a, const Persistable &b);

        /**
         * @brief Link `a` and `b`.
         *
         * Refused (with a warning) if they are already linked. OneToOne first soft
         * deletes any existing row of either side. The new row gets a fresh id,
         * audit fields and the known columns of `extra`.
         *
         * @return Result of the connector's create.
         */
        bool add(const Persistable &a, const Persistable &b, const json &extra = json::object());

        /**
         * @brief Unlink `a` and `b` by soft deleting their active row.
         *
         * The found row is loaded into this instance, stamped and persisted
         * through an update.
         *
         * @return `false` (with a warning) if no active row links them.
         */
        bool remove(const Persistable &a, const Persistable &b);

        /// Update the additional columns of the row linking `a` and `b`.
        bool updateRelation(const Persistable &a, const Persistable &b, const json &data);

        /**
         * @brief Apply `action` to rows referencing `model`, which is being deleted.
         *
         * `restrict` raises ConstraintError while active rows exist; `cascade` and
         * `softDelete` soft delete them.
         *
         * @return `true` if the deletion of `model` may proceed.
         */
        bool handleModelDeletion(const Persistable &model, CascadeAction action);

        /// @throws SchemaError for an unknown action name.
        bool handleModelDeletion(const Persistable &model, const std::string &action);

        /// Soft delete the rows of `a`, or only the one linking `a` and `b`.
        bool softDeleteRelationship(const Persistable &a, const Persistable *b = nullptr);

        /// Restore the rows of `a`, or only the one linking `a` and `b`.
        bool restoreRelationship(const Persistable &a, const Persistable *b = nullptr);

    private:
        json pairCriteria(const Persistable &a, const Persistable &b) const;

        void stampCreated();

        void stampUpdated();

        ModelContext m_ctx;
        RelationshipMetadataPtr m_metadata;
        json m_values = json::object();
    };
} // mdb

#endif //MODELBASE_RELATIONSHIP_H
