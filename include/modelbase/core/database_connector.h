/**
 * @file database_connector.h
 * @brief Persistence seam of the framework.
 *
 * The framework never builds SQL itself. Entities and relationship rows are
 * handed to a DatabaseConnector implementation through the Persistable view.
 */

#ifndef MODELBASE_DATABASE_CONNECTOR_H
#define MODELBASE_DATABASE_CONNECTOR_H

#include <string>
#include <vector>

#include "types.h"
#include "../metadata/field_descriptor.h"

namespace mdb {
    /**
     * @brief What a connector sees of a model or relationship row.
     */
    class Persistable {
    public:
        virtual ~Persistable() = default;

        /// Entity or relationship name.
        [[nodiscard]] virtual std::string name() const = 0;

        [[nodiscard]] virtual std::string tableName() const = 0;

        [[nodiscard]] virtual const FieldList &fieldDescriptors() const = 0;

        /// Current value of a field, `null` if unset.
        [[nodiscard]] virtual json get(const std::string &field_name) const = 0;

        /// Values of all storage-backed fields, keyed by field name.
        [[nodiscard]] virtual Record values() const = 0;
    };

    /**
     * @brief Abstract database access used by models and relationships.
     *
     * Criteria are JSON objects mapping a field name to the required value; a
     * `null` value matches SQL NULL. `params` may carry `limit`, `offset` and
     * `orderBy` (`[{field, direction}]`).
     */
    class DatabaseConnector {
    public:
        virtual ~DatabaseConnector() = default;

        /**
         * @brief Rows of `entity`'s table matching `criteria`.
         * @param entity Table owner
         * @param criteria Field/value filter
         * @param fields Projection, all columns when empty
         * @param params Paging and ordering
         */
        virtual Records find(const Persistable &entity,
                             const json &criteria,
                             const std::vector<std::string> &fields = {},
                             const json &params = json::object()) = 0;

        virtual bool create(const Persistable &entity) = 0;

        virtual bool update(const Persistable &entity) = 0;

        /// Persist the soft-delete markers already stamped on `entity`.
        virtual bool softDelete(const Persistable &entity) = 0;

        virtual bool hardDelete(const Persistable &entity) = 0;

        virtual bool recordExists(const std::string &table, const json &criteria) = 0;

        /**
         * @brief Soft delete every active row whose `field_name` equals `value`.
         * @return Number of rows affected.
         */
        virtual int bulkSoftDeleteByFieldValue(const Persistable &entity,
                                               const std::string &field_name,
                                               const json &value,
                                               const std::string &deleted_by) = 0;

        virtual int bulkSoftDeleteByCriteria(const Persistable &entity,
                                             const json &criteria,
                                             const std::string &deleted_by) = 0;

        /// Clear the soft-delete markers of rows matching `criteria`.
        virtual int bulkRestoreByCriteria(const Persistable &entity, const json &criteria) = 0;

        virtual int count(const Persistable &entity, const json &criteria) = 0;
    };
} // mdb

#endif //MODELBASE_DATABASE_CONNECTOR_H
