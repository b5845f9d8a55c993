#include "../../include/modelbase/metadata/entity_metadata.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

#include <unordered_set>

namespace mdb {
    namespace {
        std::vector<std::string> stringList(const json &data, const std::string &key) {
            const auto &value = data[key];
            if (!value.is_array())
                throw SchemaError(std::format("Expected `{}` to be an array of strings", key));

            std::vector<std::string> out;
            for (const auto &item: value) {
                if (!item.is_string())
                    throw SchemaError(std::format("Expected `{}` to be an array of strings", key));
                out.push_back(item.get<std::string>());
            }
            return out;
        }

        SortSpec sortSpecFromJSON(const json &item) {
            if (item.is_string())
                return {item.get<std::string>(), "asc"};

            if (!item.is_object() || !item.contains("field") || !item["field"].is_string())
                throw SchemaError("Each `defaultSort` entry needs a `field`");

            auto direction = toLower(item.value("direction", "asc"));
            if (direction != "asc" && direction != "desc")
                throw SchemaError(std::format("Invalid sort direction `{}`", direction));
            return {item["field"].get<std::string>(), direction};
        }

        bool isSortableType(const FieldType type) {
            switch (type) {
                case FieldType::ID:
                case FieldType::Text:
                case FieldType::Email:
                case FieldType::Integer:
                case FieldType::Float:
                case FieldType::Boolean:
                case FieldType::Date:
                case FieldType::DateTime:
                case FieldType::Enum:
                case FieldType::RadioButtonSet:
                    return true;
                default:
                    return false;
            }
        }
    }

    nlohmann::ordered_json PaginationConfig::toJSON() const {
        return {
            {"defaultPageSize", defaultPageSize},
            {"maxPageSize", maxPageSize},
            {"pageSizeOptions", pageSizeOptions}
        };
    }

    PaginationConfig PaginationConfig::fromJSON(const nlohmann::ordered_json &data) {
        PaginationConfig config;
        if (!data.is_object())
            throw SchemaError("Expected `pagination` to be an object");

        if (data.contains("defaultPageSize")) {
            if (!data["defaultPageSize"].is_number_integer())
                throw SchemaError("Expected `pagination.defaultPageSize` to be an integer");
            config.defaultPageSize = data["defaultPageSize"].get<int>();
        }
        if (data.contains("maxPageSize")) {
            if (!data["maxPageSize"].is_number_integer())
                throw SchemaError("Expected `pagination.maxPageSize` to be an integer");
            config.maxPageSize = data["maxPageSize"].get<int>();
        }
        if (data.contains("pageSizeOptions")) {
            if (!data["pageSizeOptions"].is_array())
                throw SchemaError("Expected `pagination.pageSizeOptions` to be an array");
            config.pageSizeOptions.clear();
            for (const auto &size: data["pageSizeOptions"]) {
                if (!size.is_number_integer())
                    throw SchemaError("Expected `pagination.pageSizeOptions` to hold integers");
                config.pageSizeOptions.push_back(size.get<int>());
            }
        }

        if (config.defaultPageSize <= 0 || config.maxPageSize < config.defaultPageSize)
            throw SchemaError(std::format("Invalid page sizes, default {} and max {}",
                                          config.defaultPageSize, config.maxPageSize));
        return config;
    }

    EntityMetadata::EntityMetadata(const std::string &entity_name) {
        setName(entity_name);
    }

    EntityMetadata EntityMetadata::fromJSON(const nlohmann::ordered_json &data) {
        if (!data.is_object())
            throw SchemaError("Entity metadata must be a JSON object");

        if (!data.contains("name") || !data["name"].is_string())
            throw SchemaError("Entity metadata is missing `name`");

        EntityMetadata meta(data["name"].get<std::string>());

        if (data.contains("table") && data["table"].is_string())
            meta.setTable(data["table"].get<std::string>());
        if (data.contains("description") && data["description"].is_string())
            meta.setDescription(data["description"].get<std::string>());
        if (data.contains("extends") && data["extends"].is_string())
            meta.setParent(data["extends"].get<std::string>());

        if (data.contains("fields"))
            meta.m_fields = fieldsFromJSON(data["fields"]);

        if (data.contains("relationships")) {
            const auto &rels = data["relationships"];
            if (rels.is_array()) {
                for (const auto &rel: rels) {
                    if (rel.is_string())
                        meta.addRelationshipName(rel.get<std::string>());
                    else if (rel.is_object() && rel.contains("name") && rel["name"].is_string())
                        meta.addInlineRelationship(rel["name"].get<std::string>(), rel);
                    else
                        throw SchemaError(std::format("Malformed relationship entry in `{}`", meta.name()));
                }
            } else if (rels.is_object()) {
                for (const auto &[rel_name, rel]: rels.items()) {
                    if (!rel.is_object())
                        throw SchemaError(std::format("Relationship `{}` of `{}` must be an object",
                                                      rel_name, meta.name()));
                    meta.addInlineRelationship(rel_name, rel);
                }
            } else if (!rels.is_null()) {
                throw SchemaError(std::format("Expected `relationships` of `{}` to be an array or object",
                                              meta.name()));
            }
        }

        if (data.contains("searchableFields"))
            meta.m_searchable = stringList(data, "searchableFields");
        if (data.contains("sortableFields"))
            meta.m_sortable = stringList(data, "sortableFields");

        if (data.contains("defaultSort")) {
            const auto &sort = data["defaultSort"];
            std::vector<SortSpec> specs;
            if (sort.is_array()) {
                for (const auto &item: sort)
                    specs.push_back(sortSpecFromJSON(item));
            } else {
                specs.push_back(sortSpecFromJSON(sort));
            }
            meta.m_defaultSort = specs;
        }

        if (data.contains("pagination"))
            meta.m_pagination = PaginationConfig::fromJSON(data["pagination"]);

        if (data.contains("ui"))
            meta.m_ui = data["ui"];

        return meta;
    }

    bool EntityMetadata::operator==(const EntityMetadata &other) const {
        return toJSON() == other.toJSON();
    }

    const std::string &EntityMetadata::name() const { return m_name; }

    EntityMetadata &EntityMetadata::setName(const std::string &name) {
        if (trim(name).empty())
            throw SchemaError("Entity name is required!");

        m_name = trim(name);
        return *this;
    }

    std::string EntityMetadata::table() const {
        return m_table.empty() ? toLower(m_name) : m_table;
    }

    EntityMetadata &EntityMetadata::setTable(const std::string &table) {
        m_table = trim(table);
        return *this;
    }

    const std::string &EntityMetadata::description() const { return m_description; }

    EntityMetadata &EntityMetadata::setDescription(const std::string &description) {
        m_description = description;
        return *this;
    }

    const std::string &EntityMetadata::parent() const { return m_parent; }

    EntityMetadata &EntityMetadata::setParent(const std::string &parent) {
        m_parent = trim(parent);
        return *this;
    }

    const FieldList &EntityMetadata::fields() const { return m_fields; }

    const FieldDescriptor *EntityMetadata::field(const std::string &field_name) const {
        return findField(m_fields, field_name);
    }

    bool EntityMetadata::hasField(const std::string &field_name) const {
        return field(field_name) != nullptr;
    }

    EntityMetadata &EntityMetadata::addField(const FieldDescriptor &field) {
        mergeFields(m_fields, {field});
        return *this;
    }

    FieldList &EntityMetadata::mutableFields() { return m_fields; }

    void EntityMetadata::mergeCoreFields(const FieldList &core) {
        FieldList merged = core;
        mergeFields(merged, m_fields);
        m_fields = std::move(merged);
    }

    const std::vector<std::string> &EntityMetadata::relationshipNames() const { return m_relationshipNames; }

    EntityMetadata &EntityMetadata::addRelationshipName(const std::string &name) {
        if (std::ranges::find(m_relationshipNames, name) == m_relationshipNames.end())
            m_relationshipNames.push_back(name);
        return *this;
    }

    const nlohmann::ordered_json &EntityMetadata::inlineRelationships() const { return m_inlineRelationships; }

    EntityMetadata &EntityMetadata::addInlineRelationship(const std::string &name, const nlohmann::ordered_json &definition) {
        auto def = definition;
        def["name"] = name;
        m_inlineRelationships[name] = def;
        addRelationshipName(name);
        return *this;
    }

    std::vector<std::string> EntityMetadata::searchableFields() const {
        if (m_searchable.has_value())
            return m_searchable.value();

        std::vector<std::string> out;
        for (const auto &f: m_fields) {
            if (!f.isDBField()) continue;
            if (f.type() == FieldType::Text || f.type() == FieldType::BigText || f.type() == FieldType::Email)
                out.push_back(f.name());
        }
        return out;
    }

    std::vector<std::string> EntityMetadata::sortableFields() const {
        if (m_sortable.has_value())
            return m_sortable.value();

        std::vector<std::string> out;
        for (const auto &f: m_fields) {
            if (f.isDBField() && isSortableType(f.type()))
                out.push_back(f.name());
        }
        return out;
    }

    std::vector<SortSpec> EntityMetadata::defaultSort() const {
        if (m_defaultSort.has_value())
            return m_defaultSort.value();
        return {{"id", "asc"}};
    }

    const PaginationConfig &EntityMetadata::pagination() const { return m_pagination; }

    EntityMetadata &EntityMetadata::setPagination(const PaginationConfig &pagination) {
        m_pagination = pagination;
        return *this;
    }

    const nlohmann::ordered_json &EntityMetadata::ui() const { return m_ui; }

    nlohmann::ordered_json EntityMetadata::toJSON() const {
        json data = {
            {"name", m_name},
            {"table", table()},
            {"description", m_description},
            {"fields", fieldsToJSON(m_fields)},
            {"pagination", m_pagination.toJSON()}
        };

        if (!m_parent.empty())
            data["extends"] = m_parent;

        auto rels = json::array();
        for (const auto &rel_name: m_relationshipNames) {
            if (m_inlineRelationships.contains(rel_name))
                rels.push_back(m_inlineRelationships[rel_name]);
            else
                rels.push_back(rel_name);
        }
        data["relationships"] = rels;

        if (m_searchable.has_value())
            data["searchableFields"] = m_searchable.value();
        if (m_sortable.has_value())
            data["sortableFields"] = m_sortable.value();
        if (m_defaultSort.has_value()) {
            auto sort = json::array();
            for (const auto &spec: m_defaultSort.value())
                sort.push_back({{"field", spec.field}, {"direction", spec.direction}});
            data["defaultSort"] = sort;
        }
        if (!m_ui.is_null())
            data["ui"] = m_ui;

        return data;
    }

    std::optional<std::string> EntityMetadata::validate() const {
        if (m_name.empty())
            return "Entity name is required";

        if (table().empty())
            return std::format("Entity `{}` has no table name", m_name);

        std::unordered_set<std::string> seen;
        for (const auto &f: m_fields) {
            if (!seen.insert(f.name()).second)
                return std::format("Duplicate field `{}` in entity `{}`", f.name(), m_name);

            if (const auto err = f.validate(); err.has_value())
                return std::format("Field `{}` of entity `{}`: {}", f.name(), m_name, err.value());
        }

        for (const auto &name: searchableFields()) {
            if (!seen.contains(name))
                return std::format("Searchable field `{}` is not a field of `{}`", name, m_name);
        }
        for (const auto &name: sortableFields()) {
            if (!seen.contains(name))
                return std::format("Sortable field `{}` is not a field of `{}`", name, m_name);
        }

        return std::nullopt;
    }

    nlohmann::ordered_json EntityMetadata::summary() const {
        return {
            {"name", m_name},
            {"table", table()},
            {"description", m_description},
            {"fieldCount", m_fields.size()},
            {"relationshipCount", m_relationshipNames.size()}
        };
    }
} // mdb
