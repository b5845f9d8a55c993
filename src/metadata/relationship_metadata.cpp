#include "../../include/modelbase/metadata/relationship_metadata.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    std::string relationshipTypeToString(const RelationshipType type) {
        switch (type) {
            case RelationshipType::OneToOne: return "OneToOne";
            case RelationshipType::OneToMany: return "OneToMany";
            case RelationshipType::ManyToMany: return "ManyToMany";
        }
        return "";
    }

    RelationshipType relationshipTypeFromString(const std::string &type) {
        if (type == "OneToOne") return RelationshipType::OneToOne;
        if (type == "OneToMany") return RelationshipType::OneToMany;
        if (type == "ManyToMany") return RelationshipType::ManyToMany;

        throw SchemaError(std::format("Unknown relationship type `{}`", type),
                          "Expected one of OneToOne, OneToMany, ManyToMany");
    }

    std::string cascadeActionToString(const CascadeAction action) {
        switch (action) {
            case CascadeAction::Restrict: return "restrict";
            case CascadeAction::Cascade: return "cascade";
            case CascadeAction::SoftDelete: return "softDelete";
        }
        return "";
    }

    CascadeAction cascadeActionFromString(const std::string &action) {
        if (action == "restrict") return CascadeAction::Restrict;
        if (action == "cascade") return CascadeAction::Cascade;
        if (action == "softDelete" || action == "soft_delete") return CascadeAction::SoftDelete;

        throw SchemaError(std::format("Unknown cascade action `{}`", action),
                          "Expected one of restrict, cascade, softDelete");
    }

    bool RelationshipMetadata::operator==(const RelationshipMetadata &other) const {
        return toJSON() == other.toJSON();
    }

    std::vector<std::string> RelationshipMetadata::participants() const {
        if (type == RelationshipType::OneToMany)
            return {modelOne, modelMany};
        return {modelA, modelB};
    }

    bool RelationshipMetadata::involves(const std::string &model) const {
        const auto models = participants();
        return std::ranges::find(models, model) != models.end();
    }

    nlohmann::ordered_json RelationshipMetadata::toJSON() const {
        json data = {
            {"name", name},
            {"type", relationshipTypeToString(type)},
            {"table", table},
            {"fields", fieldsToJSON(fields)},
            {"additionalFields", fieldsToJSON(additionalFields)},
            {"constraints", constraints},
            {"cascadeOnDelete", cascadeActionToString(cascadeOnDelete)},
            {"description", description}
        };

        if (type == RelationshipType::OneToMany) {
            data["modelOne"] = modelOne;
            data["modelMany"] = modelMany;
        } else {
            data["modelA"] = modelA;
            data["modelB"] = modelB;
        }

        if (!ownerEntity.empty())
            data["ownerEntity"] = ownerEntity;

        return data;
    }

    RelationshipMetadata RelationshipMetadata::fromJSON(const nlohmann::ordered_json &data) {
        if (!data.is_object())
            throw SchemaError("Relationship metadata must be a JSON object");

        for (const auto *key: {"name", "type"}) {
            if (!data.contains(key) || !data[key].is_string())
                throw SchemaError(std::format("Relationship metadata is missing `{}`", key));
        }

        RelationshipMetadata meta;
        meta.name = data["name"].get<std::string>();
        meta.type = relationshipTypeFromString(data["type"].get<std::string>());
        meta.modelA = data.value("modelA", "");
        meta.modelB = data.value("modelB", "");
        meta.modelOne = data.value("modelOne", "");
        meta.modelMany = data.value("modelMany", "");
        meta.table = data.value("table", "");
        meta.ownerEntity = data.value("ownerEntity", "");
        meta.description = data.value("description", "");
        meta.cascadeOnDelete = cascadeActionFromString(data.value("cascadeOnDelete", "restrict"));

        if (data.contains("fields"))
            meta.fields = fieldsFromJSON(data["fields"]);
        if (data.contains("additionalFields"))
            meta.additionalFields = fieldsFromJSON(data["additionalFields"]);

        if (data.contains("constraints")) {
            if (!data["constraints"].is_array())
                throw SchemaError(std::format("Expected `constraints` of `{}` to be an array", meta.name));
            for (const auto &c: data["constraints"]) {
                // Constraints are either plain names or objects, objects are kept as their dump
                meta.constraints.push_back(c.is_string() ? c.get<std::string>() : c.dump());
            }
        }

        return meta;
    }
} // mdb
