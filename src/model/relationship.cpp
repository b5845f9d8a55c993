#include "../../include/modelbase/model/relationship.h"
#include "../../include/modelbase/metadata/relationship_resolver.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"
#include "../../include/modelbase/utils/uuidv7.h"

#include <cmath>

namespace mdb {
    Relationship::Relationship(ModelContext ctx, RelationshipMetadataPtr metadata)
        : m_ctx(std::move(ctx)),
          m_metadata(std::move(metadata)) {
        if (!m_metadata)
            throw SchemaError("Relationship metadata is required");
    }

    std::string Relationship::name() const { return m_metadata->name; }

    std::string Relationship::tableName() const { return m_metadata->table; }

    const FieldList &Relationship::fieldDescriptors() const { return m_metadata->fields; }

    json Relationship::get(const std::string &field_name) const {
        if (m_values.contains(field_name))
            return m_values[field_name];

        if (const auto *field = findField(m_metadata->fields, field_name))
            return field->defaultValue();
        return nullptr;
    }

    Record Relationship::values() const {
        Record row = json::object();
        for (const auto &field: m_metadata->fields) {
            if (field.isDBField())
                row[field.name()] = get(field.name());
        }
        return row;
    }

    const RelationshipMetadata &Relationship::metadata() const { return *m_metadata; }

    RelationshipType Relationship::type() const { return m_metadata->type; }

    bool Relationship::hasField(const std::string &field_name) const {
        return findField(m_metadata->fields, field_name) != nullptr;
    }

    bool Relationship::set(const std::string &field_name, const json &value) {
        if (!hasField(field_name)) {
            logger::debug("Relationship `{}` has no field `{}`", name(), field_name);
            return false;
        }
        m_values[field_name] = value;
        return true;
    }

    void Relationship::populateFromRow(const Record &row) {
        reset();
        if (!row.is_object()) return;

        for (const auto &[key, value]: row.items()) {
            if (hasField(key))
                m_values[key] = value;
        }
    }

    void Relationship::reset() {
        m_values = json::object();
    }

    std::string Relationship::modelIdField(const Persistable &model) const {
        return RelationshipResolver::modelIdField(*m_metadata, model.name());
    }

    std::string Relationship::otherModel(const std::string &entity_name) const {
        const auto models = m_metadata->participants();
        if (entity_name == models[0])
            return models[1];
        if (entity_name == models[1])
            return models[0];

        throw SchemaError(std::format("`{}` is not part of relationship `{}`", entity_name, name()));
    }

    Records Relationship::relatedRecords(const Persistable &model) {
        const json criteria = {
            {modelIdField(model), model.get("id")},
            {"deleted_at", nullptr}
        };

        json params = json::object();
        if (type() == RelationshipType::OneToOne)
            params["limit"] = 1;

        auto records = m_ctx.db.find(*this, criteria, {}, params);
        logger::debug("Found {} `{}` rows for {} `{}`", records.size(), name(), model.name(),
                      model.get("id").dump());
        return records;
    }

    int Relationship::activeRelatedCount(const Persistable &model) {
        return m_ctx.db.count(*this, {
                                  {modelIdField(model), model.get("id")},
                                  {"deleted_at", nullptr}
                              });
    }

    json Relationship::relatedPaginated(const Persistable &model, int page, int per_page) {
        page = std::max(page, 1);
        per_page = std::max(per_page, 1);

        const auto offset = (page - 1) * per_page;
        const auto total = activeRelatedCount(model);

        const json criteria = {
            {modelIdField(model), model.get("id")},
            {"deleted_at", nullptr}
        };
        const auto records = m_ctx.db.find(*this, criteria, {}, {{"limit", per_page}, {"offset", offset}});

        return {
            {"records", records},
            {
                "pagination", {
                    {"current_page", page},
                    {"per_page", per_page},
                    {"total", total},
                    {"has_more", offset + per_page < total},
                    {"total_pages", static_cast<int>(std::ceil(static_cast<double>(total) / per_page))}
                }
            }
        };
    }

    bool Relationship::has(const Persistable &a, const Persistable &b) {
        auto criteria = pairCriteria(a, b);
        criteria["deleted_at"] = nullptr;
        return !m_ctx.db.find(*this, criteria, {}, {{"limit", 1}}).empty();
    }

    bool Relationship::add(const Persistable &a, const Persistable &b, const json &extra) {
        TRACE_METHOD();

        if (has(a, b)) {
            logger::warn("Relationship `{}` between {} `{}` and {} `{}` already exists",
                         name(), a.name(), a.get("id").dump(), b.name(), b.get("id").dump());
            return false;
        }

        if (type() == RelationshipType::OneToOne) {
            const auto user = m_ctx.userId();
            for (const auto *model: {&a, &b}) {
                const auto affected = m_ctx.db.bulkSoftDeleteByFieldValue(
                    *this, modelIdField(*model), model->get("id"), user);
                if (affected > 0)
                    logger::debug("Soft deleted {} previous `{}` rows of {} `{}`",
                                  affected, name(), model->name(), model->get("id").dump());
            }
        }

        reset();
        set(modelIdField(a), a.get("id"));
        set(modelIdField(b), b.get("id"));
        set("id", generateUuidV7());
        stampCreated();

        if (extra.is_object()) {
            for (const auto &[key, value]: extra.items()) {
                if (findField(RelationshipResolver::generateKeyFields(*m_metadata), key)) {
                    logger::warn("Ignoring `{}` for relationship `{}`, key columns are set from the models",
                                 key, name());
                    continue;
                }
                set(key, value);
            }
        }

        const bool ok = m_ctx.db.create(*this);
        if (ok)
            logger::info("Relationship `{}` added between {} `{}` and {} `{}`",
                         name(), a.name(), a.get("id").dump(), b.name(), b.get("id").dump());
        return ok;
    }

    bool Relationship::remove(const Persistable &a, const Persistable &b) {
        TRACE_METHOD();

        auto criteria = pairCriteria(a, b);
        criteria["deleted_at"] = nullptr;

        const auto rows = m_ctx.db.find(*this, criteria, {}, {{"limit", 1}});
        if (rows.empty()) {
            logger::warn("No active `{}` row between {} `{}` and {} `{}` to remove",
                         name(), a.name(), a.get("id").dump(), b.name(), b.get("id").dump());
            return false;
        }

        populateFromRow(rows.front());
        set("deleted_at", currentDateTime());
        set("deleted_by", m_ctx.userId());

        const bool ok = m_ctx.db.update(*this);
        if (ok)
            logger::info("Relationship `{}` row `{}` soft deleted", name(), get("id").dump());
        return ok;
    }

    bool Relationship::updateRelation(const Persistable &a, const Persistable &b, const json &data) {
        auto criteria = pairCriteria(a, b);
        criteria["deleted_at"] = nullptr;

        const auto rows = m_ctx.db.find(*this, criteria, {}, {{"limit", 1}});
        if (rows.empty()) {
            logger::warn("No active `{}` row between {} `{}` and {} `{}` to update",
                         name(), a.name(), a.get("id").dump(), b.name(), b.get("id").dump());
            return false;
        }

        populateFromRow(rows.front());

        // Only additional columns are caller-writable
        for (const auto &[key, value]: data.items()) {
            if (findField(m_metadata->additionalFields, key))
                set(key, value);
            else
                logger::warn("Ignoring `{}` for relationship `{}`, not an additional field", key, name());
        }
        stampUpdated();

        return m_ctx.db.update(*this);
    }

    bool Relationship::handleModelDeletion(const Persistable &model, const CascadeAction action) {
        const auto field = modelIdField(model);
        const auto id = model.get("id");

        switch (action) {
            case CascadeAction::Restrict: {
                const auto active = activeRelatedCount(model);
                if (active > 0)
                    throw ConstraintError(
                        std::format("Cannot delete {} `{}`, it has {} active `{}` relationship(s)",
                                    model.name(), id.is_string() ? id.get<std::string>() : id.dump(),
                                    active, name()),
                        std::format("Cascade action of `{}` is restrict", name()));
                return true;
            }
            case CascadeAction::Cascade:
            case CascadeAction::SoftDelete: {
                const auto affected = m_ctx.db.bulkSoftDeleteByFieldValue(*this, field, id, m_ctx.userId());
                logger::info("Soft deleted {} `{}` rows of deleted {} `{}`", affected, name(), model.name(),
                             id.dump());
                return true;
            }
        }
        return false;
    }

    bool Relationship::handleModelDeletion(const Persistable &model, const std::string &action) {
        return handleModelDeletion(model, cascadeActionFromString(action));
    }

    bool Relationship::softDeleteRelationship(const Persistable &a, const Persistable *b) {
        const auto user = m_ctx.userId();

        int affected = 0;
        if (b == nullptr)
            affected = m_ctx.db.bulkSoftDeleteByFieldValue(*this, modelIdField(a), a.get("id"), user);
        else
            affected = m_ctx.db.bulkSoftDeleteByCriteria(*this, pairCriteria(a, *b), user);

        logger::info("Soft deleted {} `{}` rows", affected, name());
        return affected > 0;
    }

    bool Relationship::restoreRelationship(const Persistable &a, const Persistable *b) {
        const auto criteria = b == nullptr
                                  ? json{{modelIdField(a), a.get("id")}}
                                  : pairCriteria(a, *b);

        const auto restored = m_ctx.db.bulkRestoreByCriteria(*this, criteria);
        logger::info("Restored {} `{}` rows", restored, name());
        return restored > 0;
    }

    json Relationship::pairCriteria(const Persistable &a, const Persistable &b) const {
        return {
            {modelIdField(a), a.get("id")},
            {modelIdField(b), b.get("id")}
        };
    }

    void Relationship::stampCreated() {
        const auto now = currentDateTime();
        const auto user = m_ctx.userId();
        set("created_at", now);
        set("created_by", user);
        set("updated_at", now);
        set("updated_by", user);
    }

    void Relationship::stampUpdated() {
        set("updated_at", currentDateTime());
        set("updated_by", m_ctx.userId());
    }
} // mdb
