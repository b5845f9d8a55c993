#include "../../include/modelbase/model/model.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"
#include "../../include/modelbase/utils/uuidv7.h"

namespace mdb {
    Model::Model(ModelContext ctx, const std::string &entity_name)
        : m_ctx(std::move(ctx)),
          m_metadata(m_ctx.engine.entityMetadata(entity_name)) {
    }

    std::string Model::name() const { return m_metadata->name(); }

    std::string Model::tableName() const { return m_metadata->table(); }

    const FieldList &Model::fieldDescriptors() const { return m_metadata->fields(); }

    json Model::get(const std::string &field_name) const {
        if (const auto *f = field(field_name))
            return f->value();
        return nullptr;
    }

    Record Model::values() const {
        Record row = json::object();
        for (const auto &f: fields()) {
            if (f->descriptor().isDBField())
                row[f->name()] = f->value();
        }
        return row;
    }

    const EntityMetadata &Model::metadata() const { return *m_metadata; }

    const std::vector<std::unique_ptr<FieldBase>> &Model::fields() const {
        ensureFields();
        return m_fields;
    }

    FieldBase *Model::field(const std::string &field_name) const {
        for (const auto &f: fields()) {
            if (f->name() == field_name)
                return f.get();
        }
        return nullptr;
    }

    bool Model::hasField(const std::string &field_name) const {
        return m_metadata->hasField(field_name);
    }

    bool Model::set(const std::string &field_name, const json &value) {
        auto *f = field(field_name);
        if (f == nullptr) {
            logger::warn("Entity `{}` has no field `{}`", name(), field_name);
            return false;
        }

        if (!f->setValue(value)) {
            m_errors[field_name] = f->validationErrors();
            return false;
        }

        m_errors.erase(field_name);
        return true;
    }

    void Model::populateFromRow(const Record &row) {
        if (!row.is_object()) return;

        for (const auto &f: fields()) {
            if (row.contains(f->name()))
                f->setValueFromTrustedSource(row[f->name()]);
        }
        m_errors = json::object();
    }

    json Model::toJSON() const {
        json data = json::object();
        for (const auto &f: fields())
            data[f->name()] = f->value();
        return data;
    }

    bool Model::validate() {
        m_errors = json::object();
        for (const auto &f: fields()) {
            if (const auto errors = f->validate(ruleContext(*f)); !errors.empty())
                m_errors[f->name()] = errors;
        }
        return m_errors.empty();
    }

    json Model::validationErrors() const { return m_errors; }

    bool Model::create() {
        TRACE_METHOD();

        if (auto *id = field("id"); id != nullptr && id->value().is_null())
            id->setValueFromTrustedSource(generateUuidV7());
        stampCreated();

        if (!validate()) {
            logger::warn("Not creating invalid `{}` record: {}", name(), m_errors.dump());
            return false;
        }

        const bool ok = m_ctx.db.create(*this);
        if (ok)
            logger::debug("Created `{}` record `{}`", name(), get("id").dump());
        return ok;
    }

    bool Model::update() {
        TRACE_METHOD();

        if (get("id").is_null()) {
            logger::warn("Can't update a `{}` record without an id", name());
            return false;
        }
        stampUpdated();

        if (!validate()) {
            logger::warn("Not updating invalid `{}` record `{}`: {}", name(), get("id").dump(), m_errors.dump());
            return false;
        }
        return m_ctx.db.update(*this);
    }

    bool Model::softDelete() {
        if (get("id").is_null()) {
            logger::warn("Can't delete a `{}` record without an id", name());
            return false;
        }

        if (auto *f = field("deleted_at")) f->setValueFromTrustedSource(currentDateTime());
        if (auto *f = field("deleted_by")) f->setValueFromTrustedSource(m_ctx.userId());
        return m_ctx.db.softDelete(*this);
    }

    bool Model::hardDelete() {
        if (get("id").is_null()) {
            logger::warn("Can't delete a `{}` record without an id", name());
            return false;
        }
        return m_ctx.db.hardDelete(*this);
    }

    bool Model::restore() {
        if (!isDeleted()) return false;

        if (auto *f = field("deleted_at")) f->setValueFromTrustedSource(nullptr);
        if (auto *f = field("deleted_by")) f->setValueFromTrustedSource(nullptr);
        stampUpdated();
        return m_ctx.db.update(*this);
    }

    bool Model::remove(const std::optional<CascadeAction> action) {
        TRACE_METHOD();

        for (const auto &rel: relationships()) {
            const auto cascade = action.value_or(rel->metadata().cascadeOnDelete);
            try {
                if (!rel->handleModelDeletion(*this, cascade)) {
                    logger::critical("Relationship `{}` refused the deletion of `{}` record `{}`",
                                     rel->name(), name(), get("id").dump());
                    return false;
                }
            } catch (const std::exception &e) {
                logger::critical("Deleting `{}` record `{}` failed in relationship `{}`: {}",
                                 name(), get("id").dump(), rel->name(), e.what());
                throw;
            }
        }

        return softDelete();
    }

    bool Model::isDeleted() const {
        return !get("deleted_at").is_null();
    }

    const std::vector<std::unique_ptr<Relationship>> &Model::relationships() const {
        ensureRelationships();
        return m_relationships;
    }

    Relationship *Model::relationship(const std::string &rel_name) const {
        for (const auto &rel: relationships()) {
            if (rel->name() == rel_name)
                return rel.get();
        }
        return nullptr;
    }

    bool Model::addRelation(const std::string &rel_name, const Model &other, const json &extra) {
        return requireRelationship(rel_name).add(*this, other, extra);
    }

    bool Model::removeRelation(const std::string &rel_name, const Model &other) {
        return requireRelationship(rel_name).remove(*this, other);
    }

    bool Model::hasRelation(const std::string &rel_name, const Model &other) {
        return requireRelationship(rel_name).has(*this, other);
    }

    Records Model::related(const std::string &rel_name) {
        return requireRelationship(rel_name).relatedRecords(*this);
    }

    FieldNames Model::searchableFields() const { return m_metadata->searchableFields(); }

    FieldNames Model::sortableFields() const { return m_metadata->sortableFields(); }

    std::vector<SortSpec> Model::defaultSort() const { return m_metadata->defaultSort(); }

    const PaginationConfig &Model::pagination() const { return m_metadata->pagination(); }

    void Model::ensureFields() const {
        if (m_fieldsBuilt) return;
        m_fieldsBuilt = true;

        auto &factory = m_ctx.engine.fieldFactory();
        const auto &rules = m_ctx.engine.validationRuleFactory();

        for (const auto &descriptor: m_metadata->fields()) {
            try {
                auto f = factory.create(descriptor);
                f->setUpValidationRules(rules);
                m_fields.push_back(std::move(f));
            } catch (const ModelBaseException &e) {
                logger::warn("Skipping field `{}.{}`: {}", name(), descriptor.name(), e.what());
            }
        }
    }

    void Model::ensureRelationships() const {
        if (m_relationshipsBuilt) return;
        m_relationshipsBuilt = true;

        const auto &inline_rels = m_metadata->inlineRelationships();
        for (const auto &rel_name: m_metadata->relationshipNames()) {
            const auto key = inline_rels.contains(rel_name) ? std::format("{}.{}", name(), rel_name) : rel_name;
            try {
                m_relationships.push_back(
                    std::make_unique<Relationship>(m_ctx, m_ctx.engine.relationshipMetadata(key)));
            } catch (const ModelBaseException &e) {
                logger::warn("Skipping relationship `{}` of `{}`: {}", rel_name, name(), e.what());
            }
        }
    }

    Relationship &Model::requireRelationship(const std::string &rel_name) const {
        if (auto *rel = relationship(rel_name))
            return *rel;

        std::vector<std::string> available;
        for (const auto &rel: relationships())
            available.push_back(rel->name());
        throw NotFoundError("relationship", rel_name, available);
    }

    RuleContext Model::ruleContext(const FieldBase &field) const {
        std::string related_table;
        if (const auto &related = field.descriptor().relatedModel(); !related.empty()) {
            related_table = m_ctx.engine.entityExists(related)
                                ? m_ctx.engine.entityMetadata(related)->table()
                                : toLower(related);
        }
        return RuleContext{field.descriptor(), &m_ctx.db, tableName(), get("id"), related_table};
    }

    void Model::stampCreated() {
        const auto now = currentDateTime();
        const auto user = m_ctx.userId();
        if (auto *f = field("created_at")) f->setValueFromTrustedSource(now);
        if (auto *f = field("updated_at")) f->setValueFromTrustedSource(now);
        if (auto *f = field("created_by")) f->setValueFromTrustedSource(user);
        if (auto *f = field("updated_by")) f->setValueFromTrustedSource(user);
    }

    void Model::stampUpdated() {
        if (auto *f = field("updated_at")) f->setValueFromTrustedSource(currentDateTime());
        if (auto *f = field("updated_by")) f->setValueFromTrustedSource(m_ctx.userId());
    }
} // mdb
