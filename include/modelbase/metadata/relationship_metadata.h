/**
 * @file relationship_metadata.h
 * @brief Resolved description of a relationship between two entities.
 */

#ifndef MODELBASE_RELATIONSHIP_METADATA_H
#define MODELBASE_RELATIONSHIP_METADATA_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "field_descriptor.h"

namespace mdb {
    enum class RelationshipType : uint8_t {
        OneToOne = 0,
        OneToMany,
        ManyToMany
    };

    std::string relationshipTypeToString(RelationshipType type);

    /**
     * @brief Parse a relationship type name.
     * @throws SchemaError naming the value if it is not a known type.
     */
    RelationshipType relationshipTypeFromString(const std::string &type);

    /// What happens to relationship rows when one participating record is deleted.
    enum class CascadeAction : uint8_t {
        Restrict = 0,
        Cascade,
        SoftDelete
    };

    /// `restrict`, `cascade` or `softDelete`.
    std::string cascadeActionToString(CascadeAction action);

    /**
     * @brief Parse a cascade action, `soft_delete` is accepted for `softDelete`.
     * @throws SchemaError naming the value if it is not a known action.
     */
    CascadeAction cascadeActionFromString(const std::string &action);

    struct RelationshipMetadata {
        std::string name;
        RelationshipType type = RelationshipType::ManyToMany;

        /// OneToOne and ManyToMany participants.
        std::string modelA, modelB;
        /// OneToMany participants.
        std::string modelOne, modelMany;

        /// Generated join table.
        std::string table;
        /// Core fields, generated keys and additional fields, in that order.
        FieldList fields;
        /// Additional fields as declared, before merging.
        FieldList additionalFields;
        std::vector<std::string> constraints;
        /// Declaring entity for inline relationships, empty for standalone ones.
        std::string ownerEntity;
        CascadeAction cascadeOnDelete = CascadeAction::Restrict;
        std::string description;

        bool operator==(const RelationshipMetadata &other) const;

        /// The two participants, A/B or One/Many.
        [[nodiscard]] std::vector<std::string> participants() const;

        [[nodiscard]] bool involves(const std::string &model) const;

        [[nodiscard]] nlohmann::ordered_json toJSON() const;

        /**
         * @brief Read back a resolved relationship, as written by `toJSON()`.
         * @throws SchemaError on a malformed document.
         */
        static RelationshipMetadata fromJSON(const nlohmann::ordered_json &data);
    };
} // mdb

#endif //MODELBASE_RELATIONSHIP_METADATA_H
