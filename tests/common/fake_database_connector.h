#ifndef MODELBASE_FAKE_DATABASE_CONNECTOR_H
#define MODELBASE_FAKE_DATABASE_CONNECTOR_H

#include <map>
#include <string>
#include <vector>

#include "modelbase/core/database_connector.h"
#include "modelbase/utils/utils.h"

/**
 * @brief In-memory DatabaseConnector, one row list per table.
 *
 * Criteria match on equality, a `null` criterion matches a missing or null
 * column. Every call is counted so tests can assert on I/O.
 */
class FakeDatabaseConnector final : public mdb::DatabaseConnector {
public:
    mdb::Records find(const mdb::Persistable &entity,
                      const mdb::json &criteria,
                      const std::vector<std::string> &fields,
                      const mdb::json &params) override {
        ++calls["find"];

        const auto offset = params.value("offset", 0);
        const auto limit = params.value("limit", -1);

        mdb::Records out;
        int skipped = 0;
        for (const auto &row: tables[entity.tableName()]) {
            if (!matches(row, criteria)) continue;
            if (skipped++ < offset) continue;
            if (limit >= 0 && static_cast<int>(out.size()) >= limit) break;

            if (fields.empty()) {
                out.push_back(row);
            } else {
                mdb::json projected = mdb::json::object();
                for (const auto &f: fields)
                    projected[f] = row.value(f, mdb::json());
                out.push_back(projected);
            }
        }
        return out;
    }

    bool create(const mdb::Persistable &entity) override {
        ++calls["create"];
        if (failWrites) return false;

        tables[entity.tableName()].push_back(entity.values());
        return true;
    }

    bool update(const mdb::Persistable &entity) override {
        ++calls["update"];
        return replaceRow(entity);
    }

    bool softDelete(const mdb::Persistable &entity) override {
        ++calls["softDelete"];
        return replaceRow(entity);
    }

    bool hardDelete(const mdb::Persistable &entity) override {
        ++calls["hardDelete"];
        if (failWrites) return false;

        auto &rows = tables[entity.tableName()];
        const auto removed = std::erase_if(rows, [&](const mdb::json &row) {
            return row.value("id", mdb::json()) == entity.get("id");
        });
        return removed > 0;
    }

    bool recordExists(const std::string &table, const mdb::json &criteria) override {
        ++calls["recordExists"];
        for (const auto &row: tables[table]) {
            if (matches(row, criteria)) return true;
        }
        return false;
    }

    int bulkSoftDeleteByFieldValue(const mdb::Persistable &entity,
                                   const std::string &field_name,
                                   const mdb::json &value,
                                   const std::string &deleted_by) override {
        ++calls["bulkSoftDeleteByFieldValue"];
        return bulkSoftDeleteByCriteria(entity, {{field_name, value}}, deleted_by);
    }

    int bulkSoftDeleteByCriteria(const mdb::Persistable &entity,
                                 const mdb::json &criteria,
                                 const std::string &deleted_by) override {
        ++calls["bulkSoftDeleteByCriteria"];

        auto active = criteria;
        active["deleted_at"] = nullptr;

        int affected = 0;
        for (auto &row: tables[entity.tableName()]) {
            if (!matches(row, active)) continue;
            row["deleted_at"] = mdb::currentDateTime();
            row["deleted_by"] = deleted_by;
            ++affected;
        }
        return affected;
    }

    int bulkRestoreByCriteria(const mdb::Persistable &entity, const mdb::json &criteria) override {
        ++calls["bulkRestoreByCriteria"];

        int restored = 0;
        for (auto &row: tables[entity.tableName()]) {
            if (!matches(row, criteria) || row.value("deleted_at", mdb::json()).is_null()) continue;
            row["deleted_at"] = nullptr;
            row["deleted_by"] = nullptr;
            ++restored;
        }
        return restored;
    }

    int count(const mdb::Persistable &entity, const mdb::json &criteria) override {
        ++calls["count"];

        int n = 0;
        for (const auto &row: tables[entity.tableName()]) {
            if (matches(row, criteria)) ++n;
        }
        return n;
    }

    /// Rows of `table` matching `criteria`, without counting a call.
    mdb::Records rows(const std::string &table, const mdb::json &criteria = mdb::json::object()) {
        mdb::Records out;
        for (const auto &row: tables[table]) {
            if (matches(row, criteria)) out.push_back(row);
        }
        return out;
    }

    std::map<std::string, mdb::Records> tables;
    std::map<std::string, int> calls;
    bool failWrites = false;

private:
    static bool matches(const mdb::json &row, const mdb::json &criteria) {
        for (const auto &[key, expected]: criteria.items()) {
            const auto actual = row.value(key, mdb::json());
            if (expected.is_null() ? !actual.is_null() : actual != expected)
                return false;
        }
        return true;
    }

    bool replaceRow(const mdb::Persistable &entity) {
        if (failWrites) return false;

        for (auto &row: tables[entity.tableName()]) {
            if (row.value("id", mdb::json()) == entity.get("id")) {
                row = entity.values();
                return true;
            }
        }
        return false;
    }
};

#endif //MODELBASE_FAKE_DATABASE_CONNECTOR_H
