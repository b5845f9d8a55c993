/**
 * @file relationship_resolver.h
 * @brief Turns raw relationship definitions into RelationshipMetadata.
 *
 * Resolution validates the definition, derives the join table name and builds the
 * foreign-key fields for both participants:
 *
 * | type       | table                          | keys                                 |
 * |------------|--------------------------------|--------------------------------------|
 * | OneToOne   | `rel_1_{a}_1_{b}`              | `{a}_id`, `{b}_id` (unique)          |
 * | OneToMany  | `rel_1_{one}_M_{many}`         | `one_{one}_id`, `many_{many}_id`     |
 * | ManyToMany | `rel_N_{a}_M_{b}`              | `{a}_id`, `{b}_id`                   |
 *
 * Participant names are lowercased; table names are cut to 64 characters.
 */

#ifndef MODELBASE_RELATIONSHIP_RESOLVER_H
#define MODELBASE_RELATIONSHIP_RESOLVER_H

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "relationship_metadata.h"

namespace mdb {
    class CoreFieldsProvider;

    class RelationshipResolver {
    public:
        static constexpr std::size_t kMaxTableNameLength = 64;

        /**
         * @brief Structural check of a raw relationship definition.
         * @throws SchemaError naming the missing key or the unknown type.
         */
        static void validate(const nlohmann::ordered_json &data);

        /// Join table name for the participants, truncated when too long.
        static std::string tableName(RelationshipType type, const std::string &first, const std::string &second);

        /// First `kMaxTableNameLength` characters of `name`, with a warning when cut.
        static std::string truncateTableName(const std::string &name);

        /// Foreign-key fields of both participants.
        static FieldList generateKeyFields(const RelationshipMetadata &meta);

        /**
         * @brief Validate and resolve a raw definition.
         *
         * Fields are merged as core fields of the relationship, then generated keys,
         * then `additionalFields`. An additional field named like a generated key is
         * dropped with a warning.
         *
         * @param data Raw relationship definition
         * @param core Source of the relationship's core fields
         * @param owner_entity Declaring entity for inline definitions
         * @throws SchemaError for invalid definitions.
         */
        static RelationshipMetadata resolve(const nlohmann::ordered_json &data,
                                            CoreFieldsProvider &core,
                                            const std::string &owner_entity = "");

        /**
         * @brief Name of the key column that references `participant`.
         * @throws SchemaError if `participant` is not part of the relationship.
         */
        static std::string modelIdField(const RelationshipMetadata &meta, const std::string &participant);

        /// Same as above for a raw definition; an unknown type raises SchemaError.
        static std::string modelIdField(const nlohmann::ordered_json &data, const std::string &participant);

    private:
        static FieldDescriptor keyField(const std::string &field_name, const std::string &participant,
                                        RelationshipType type);
    };
} // mdb

#endif //MODELBASE_RELATIONSHIP_RESOLVER_H
