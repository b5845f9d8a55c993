#include "../../include/modelbase/metadata/relationship_resolver.h"
#include "../../include/modelbase/metadata/core_fields.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    namespace {
        void requireKey(const json &data, const std::string &key, const std::string &rel_name) {
            if (!data.contains(key) || !data[key].is_string() || trim(data[key].get<std::string>()).empty())
                throw SchemaError(rel_name.empty()
                                      ? std::format("Relationship metadata is missing `{}`", key)
                                      : std::format("Relationship `{}` is missing `{}`", rel_name, key));
        }

        /// `data[key]` when it is a string, else empty
        std::string stringOr(const json &data, const std::string &key) {
            if (!data.contains(key)) return {};
            if (!data[key].is_string())
                throw SchemaError(std::format("Expected `{}` to be a string", key));
            return data[key].get<std::string>();
        }
    }

    void RelationshipResolver::validate(const nlohmann::ordered_json &data) {
        if (!data.is_object())
            throw SchemaError("Relationship metadata must be a JSON object");

        const auto rel_name = data.contains("name") && data["name"].is_string()
                                  ? data["name"].get<std::string>()
                                  : std::string{};

        requireKey(data, "name", rel_name);
        requireKey(data, "type", rel_name);

        switch (relationshipTypeFromString(data["type"].get<std::string>())) {
            case RelationshipType::OneToMany:
                requireKey(data, "modelOne", rel_name);
                requireKey(data, "modelMany", rel_name);
                break;
            case RelationshipType::OneToOne:
            case RelationshipType::ManyToMany:
                requireKey(data, "modelA", rel_name);
                requireKey(data, "modelB", rel_name);
                break;
        }

        if (data.contains("cascadeOnDelete")) {
            if (!data["cascadeOnDelete"].is_string())
                throw SchemaError(std::format("Expected `cascadeOnDelete` of `{}` to be a string", rel_name));
            // Throws naming the action if unknown
            (void) cascadeActionFromString(data["cascadeOnDelete"].get<std::string>());
        }
    }

    std::string RelationshipResolver::tableName(const RelationshipType type,
                                                const std::string &first,
                                                const std::string &second) {
        std::string name;
        switch (type) {
            case RelationshipType::OneToOne:
                name = std::format("rel_1_{}_1_{}", toLower(first), toLower(second));
                break;
            case RelationshipType::OneToMany:
                name = std::format("rel_1_{}_M_{}", toLower(first), toLower(second));
                break;
            case RelationshipType::ManyToMany:
                name = std::format("rel_N_{}_M_{}", toLower(first), toLower(second));
                break;
        }
        return truncateTableName(name);
    }

    std::string RelationshipResolver::truncateTableName(const std::string &name) {
        if (name.size() <= kMaxTableNameLength)
            return name;

        auto truncated = name.substr(0, kMaxTableNameLength);
        logger::warn("Table name `{}` is longer than {} characters, truncated to `{}`",
                     name, kMaxTableNameLength, truncated);
        return truncated;
    }

    FieldDescriptor RelationshipResolver::keyField(const std::string &field_name,
                                                   const std::string &participant,
                                                   const RelationshipType type) {
        FieldDescriptor key(field_name, FieldType::ID);
        key.setLabel(std::format("{} ID", participant))
                .setRequired(true)
                .setRelatedModel(participant, "id");

        std::vector<std::string> rules{"ForeignKeyExists"};
        if (type == RelationshipType::OneToOne)
            rules.emplace_back("Unique");
        key.setValidationRules(rules);

        return key;
    }

    FieldList RelationshipResolver::generateKeyFields(const RelationshipMetadata &meta) {
        FieldList keys;
        for (const auto &participant: meta.participants())
            keys.push_back(keyField(modelIdField(meta, participant), participant, meta.type));
        return keys;
    }

    RelationshipMetadata RelationshipResolver::resolve(const nlohmann::ordered_json &data,
                                                       CoreFieldsProvider &core,
                                                       const std::string &owner_entity) {
        validate(data);

        RelationshipMetadata meta;
        meta.name = trim(data["name"].get<std::string>());
        meta.type = relationshipTypeFromString(data["type"].get<std::string>());
        meta.ownerEntity = owner_entity;
        meta.description = stringOr(data, "description");

        if (meta.type == RelationshipType::OneToMany) {
            meta.modelOne = trim(data["modelOne"].get<std::string>());
            meta.modelMany = trim(data["modelMany"].get<std::string>());
        } else {
            meta.modelA = trim(data["modelA"].get<std::string>());
            meta.modelB = trim(data["modelB"].get<std::string>());
        }

        const auto models = meta.participants();
        meta.table = tableName(meta.type, models[0], models[1]);

        if (data.contains("cascadeOnDelete"))
            meta.cascadeOnDelete = cascadeActionFromString(data["cascadeOnDelete"].get<std::string>());

        if (data.contains("constraints") && data["constraints"].is_array()) {
            for (const auto &c: data["constraints"])
                meta.constraints.push_back(c.is_string() ? c.get<std::string>() : c.dump());
        }

        if (data.contains("additionalFields") && !data["additionalFields"].is_null())
            meta.additionalFields = fieldsFromJSON(data["additionalFields"]);

        meta.fields = core.allCoreFieldsForModel(meta.name);

        const auto keys = generateKeyFields(meta);
        mergeFields(meta.fields, keys);

        for (const auto &extra: meta.additionalFields) {
            if (findField(keys, extra.name())) {
                logger::warn("Additional field `{}` of relationship `{}` collides with a generated key, ignored",
                             extra.name(), meta.name);
                continue;
            }
            mergeFields(meta.fields, {extra});
        }

        logger::trace("Resolved relationship `{}` on table `{}` with {} fields",
                      meta.name, meta.table, meta.fields.size());
        return meta;
    }

    std::string RelationshipResolver::modelIdField(const RelationshipMetadata &meta, const std::string &participant) {
        switch (meta.type) {
            case RelationshipType::OneToMany:
                if (participant == meta.modelOne)
                    return std::format("one_{}_id", toLower(participant));
                if (participant == meta.modelMany)
                    return std::format("many_{}_id", toLower(participant));
                break;
            case RelationshipType::OneToOne:
            case RelationshipType::ManyToMany:
                if (participant == meta.modelA || participant == meta.modelB)
                    return std::format("{}_id", toLower(participant));
                break;
        }

        throw SchemaError(std::format("`{}` is not part of relationship `{}`", participant, meta.name));
    }

    std::string RelationshipResolver::modelIdField(const nlohmann::ordered_json &data, const std::string &participant) {
        if (!data.is_object() || !data.contains("type") || !data["type"].is_string())
            throw SchemaError("Relationship metadata is missing `type`");

        RelationshipMetadata meta;
        meta.name = stringOr(data, "name");
        meta.type = relationshipTypeFromString(data["type"].get<std::string>());
        meta.modelA = stringOr(data, "modelA");
        meta.modelB = stringOr(data, "modelB");
        meta.modelOne = stringOr(data, "modelOne");
        meta.modelMany = stringOr(data, "modelMany");
        return modelIdField(meta, participant);
    }
} // mdb
