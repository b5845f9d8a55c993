#include "../../include/modelbase/metadata/core_fields.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    CoreFieldsProvider::CoreFieldsProvider(std::string template_path)
        : m_templatePath(std::move(template_path)) {
    }

    const FieldList &CoreFieldsProvider::standardCoreFields() {
        if (m_standardFields.has_value())
            return m_standardFields.value();

        TRACE_METHOD();

        std::error_code ec;
        if (!fs::is_regular_file(m_templatePath, ec))
            throw ConfigurationError(std::format("Core fields template `{}` not found", m_templatePath));

        const auto data = readJsonFile(m_templatePath);
        if (!data.has_value())
            throw ConfigurationError(std::format("Core fields template `{}` could not be parsed", m_templatePath));

        if (!data->is_object())
            throw ConfigurationError(
                std::format("Core fields template `{}` must be a JSON object keyed by field name", m_templatePath));

        FieldList fields;
        for (const auto &[key, value]: data->items()) {
            auto entry = value;
            if (entry.is_object() && !entry.contains("name"))
                entry["name"] = key;

            if (!validateCoreFieldMetadata(entry))
                throw ConfigurationError(std::format("Invalid core field `{}` in `{}`", key, m_templatePath));

            try {
                mergeFields(fields, {FieldDescriptor(entry)});
            } catch (const SchemaError &e) {
                throw ConfigurationError(std::format("Invalid core field `{}` in `{}`", key, m_templatePath),
                                         e.what());
            }
        }

        logger::debug("Loaded {} standard core fields from `{}`", fields.size(), m_templatePath);
        m_standardFields = std::move(fields);
        return m_standardFields.value();
    }

    void CoreFieldsProvider::registerModelCoreFields(const std::string &entity_class, const FieldList &fields) {
        m_registrations[entity_class] = fields;
        invalidateDescendants(entity_class);
        logger::debug("Registered {} core fields for `{}`", fields.size(), entity_class);
    }

    FieldList CoreFieldsProvider::modelCoreFields(const std::string &entity_class) const {
        FieldList fields;
        for (const auto &cls: m_hierarchy.ancestry(entity_class)) {
            if (const auto it = m_registrations.find(cls); it != m_registrations.end())
                mergeFields(fields, it->second);
        }
        return fields;
    }

    FieldList CoreFieldsProvider::allCoreFieldsForModel(const std::string &entity_class) {
        if (const auto it = m_mergedCache.find(entity_class); it != m_mergedCache.end())
            return it->second;

        FieldList fields = standardCoreFields();
        mergeFields(fields, modelCoreFields(entity_class));

        m_mergedCache[entity_class] = fields;
        return fields;
    }

    std::optional<FieldDescriptor> CoreFieldsProvider::coreFieldWithOverrides(const std::string &field_name,
                                                                             const std::string &entity_class,
                                                                             const nlohmann::ordered_json &overrides) {
        const auto fields = allCoreFieldsForModel(entity_class);
        const auto *field = findField(fields, field_name);
        if (field == nullptr) {
            logger::warn("Core field `{}` not found for `{}`", field_name, entity_class);
            return std::nullopt;
        }

        FieldDescriptor result = *field;
        if (!overrides.is_object())
            return result;

        auto allowed = overrides;
        for (const auto *key: {"name", "type"}) {
            if (allowed.contains(key)) {
                logger::warn("Attempt to override protected key `{}` of core field `{}` ignored", key, field_name);
                allowed.erase(std::string(key));
            }
        }

        result.updateWith(allowed);
        return result;
    }

    bool CoreFieldsProvider::isCoreField(const std::string &field_name, const std::string &entity_class) {
        if (entity_class.empty())
            return findField(standardCoreFields(), field_name) != nullptr;

        const auto fields = allCoreFieldsForModel(entity_class);
        return findField(fields, field_name) != nullptr;
    }

    std::vector<std::string> CoreFieldsProvider::coreFieldNames(const std::string &entity_class) {
        std::vector<std::string> names;
        const auto fields = entity_class.empty() ? standardCoreFields() : allCoreFieldsForModel(entity_class);
        for (const auto &field: fields)
            names.push_back(field.name());
        return names;
    }

    void CoreFieldsProvider::clearCache() {
        m_mergedCache.clear();
    }

    void CoreFieldsProvider::clearCacheForModel(const std::string &entity_class) {
        m_mergedCache.erase(entity_class);
    }

    void CoreFieldsProvider::setTemplatePath(const std::string &path) {
        m_templatePath = path;
        m_standardFields.reset();
        m_mergedCache.clear();
    }

    const std::string &CoreFieldsProvider::templatePath() const {
        return m_templatePath;
    }

    void CoreFieldsProvider::declareParent(const std::string &entity_class, const std::string &parent) {
        if (m_hierarchy.parentOf(entity_class) == parent) return;

        // Descendants resolved through the old parent are stale too
        invalidateDescendants(entity_class);
        m_hierarchy.declare(entity_class, parent);
    }

    const ModelHierarchy &CoreFieldsProvider::hierarchy() const {
        return m_hierarchy;
    }

    bool CoreFieldsProvider::validateCoreFieldMetadata(const nlohmann::ordered_json &field) {
        if (!field.is_object()) {
            logger::warn("Core field metadata must be a JSON object, got `{}`", field.dump());
            return false;
        }

        for (const auto *key: {"name", "type", "label", "isDBField"}) {
            if (!field.contains(key)) {
                logger::warn("Core field metadata missing required key `{}`: {}", key, field.dump());
                return false;
            }
        }
        return true;
    }

    void CoreFieldsProvider::invalidateDescendants(const std::string &entity_class) {
        std::erase_if(m_mergedCache, [&](const auto &entry) {
            return m_hierarchy.inheritsFrom(entry.first, entity_class);
        });
    }
} // mdb
