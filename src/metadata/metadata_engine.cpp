#include "../../include/modelbase/metadata/metadata_engine.h"
#include "../../include/modelbase/metadata/relationship_resolver.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    namespace {
        constexpr auto kMetadataSuffix = "_metadata.json";
        constexpr auto kCacheFileName = "metadata_cache.json";

        template<typename T>
        std::vector<std::string> keysOf(const std::map<std::string, T> &items) {
            std::vector<std::string> keys;
            keys.reserve(items.size());
            for (const auto &[key, _]: items)
                keys.push_back(key);
            return keys;
        }
    }

    std::string cacheStateToString(const CacheState state) {
        switch (state) {
            case CacheState::Cold: return "cold";
            case CacheState::Loading: return "loading";
            case CacheState::Warm: return "warm";
        }
        return "";
    }

    // ----------------------------------------------------------------- //
    // MetadataCache
    // ----------------------------------------------------------------- //

    bool MetadataCache::empty() const {
        return entities.empty() && relationships.empty() && inlineRelationships.empty();
    }

    nlohmann::ordered_json MetadataCache::toJSON() const {
        json data = {
            {"entities", json::object()},
            {"relationships", json::object()},
            {"inline_relationships", json::object()},
            {"field_types", json::array()},
            {"validation_rules", json::array()}
        };

        for (const auto &[name, meta]: entities)
            data["entities"][name] = meta->toJSON();
        for (const auto &[name, meta]: relationships)
            data["relationships"][name] = meta->toJSON();
        for (const auto &[name, meta]: inlineRelationships)
            data["inline_relationships"][name] = meta->toJSON();
        for (const auto &ft: fieldTypes)
            data["field_types"].push_back(ft.toJSON());
        for (const auto &rule: validationRules)
            data["validation_rules"].push_back(rule.toJSON());

        return data;
    }

    MetadataCache MetadataCache::fromJSON(const nlohmann::ordered_json &data) {
        if (!data.is_object())
            throw SchemaError("Metadata cache must be a JSON object");

        for (const auto *key: {"entities", "relationships", "inline_relationships"}) {
            if (!data.contains(key) || !data[key].is_object())
                throw SchemaError(std::format("Metadata cache is missing `{}`", key));
        }

        MetadataCache cache;
        for (const auto &[name, value]: data["entities"].items())
            cache.entities[name] = std::make_shared<const EntityMetadata>(EntityMetadata::fromJSON(value));
        for (const auto &[name, value]: data["relationships"].items())
            cache.relationships[name] = std::make_shared<const RelationshipMetadata>(
                RelationshipMetadata::fromJSON(value));
        for (const auto &[name, value]: data["inline_relationships"].items())
            cache.inlineRelationships[name] = std::make_shared<const RelationshipMetadata>(
                RelationshipMetadata::fromJSON(value));

        if (data.contains("field_types") && data["field_types"].is_array()) {
            for (const auto &ft: data["field_types"])
                cache.fieldTypes.push_back(FieldTypeDescriptor::fromJSON(ft));
        }
        if (data.contains("validation_rules") && data["validation_rules"].is_array()) {
            for (const auto &rule: data["validation_rules"])
                cache.validationRules.push_back(ValidationRuleDescriptor::fromJSON(rule));
        }

        return cache;
    }

    // ----------------------------------------------------------------- //
    // MetadataEngine
    // ----------------------------------------------------------------- //

    MetadataEngine::MetadataEngine(Config config)
        : m_config(std::move(config)),
          m_coreFields(m_config.coreFieldsTemplate()),
          m_ruleCatalog(m_ruleFactory),
          m_fieldTypeCatalog(m_fieldFactory, m_ruleCatalog) {
    }

    const MetadataCache &MetadataEngine::loadAllMetadata() {
        if (m_state == CacheState::Warm)
            return m_cache;

        TRACE_METHOD();
        m_state = CacheState::Loading;

        try {
            const bool from_file = m_cacheFileAllowed && m_config.cacheEnabled() && loadFromCacheFile();
            if (!from_file)
                loadFromSources();
        } catch (...) {
            m_cache = MetadataCache{};
            m_state = CacheState::Cold;
            throw;
        }

        // Only the very first load of a process may reuse the cache file
        m_cacheFileAllowed = false;
        m_state = CacheState::Warm;

        logger::info("Metadata loaded: {} entities, {} relationships, {} inline relationships",
                     m_cache.entities.size(), m_cache.relationships.size(), m_cache.inlineRelationships.size());
        return m_cache;
    }

    EntityMetadataPtr MetadataEngine::entityMetadata(const std::string &name) {
        ensureLoaded();

        const auto resolved = resolveEntityIdentifier(name);
        if (const auto it = m_cache.entities.find(resolved); it != m_cache.entities.end())
            return it->second;

        logger::warn("Entity metadata `{}` not found in cache", resolved);
        throw NotFoundError("entity", resolved, keysOf(m_cache.entities));
    }

    RelationshipMetadataPtr MetadataEngine::relationshipMetadata(const std::string &name) {
        ensureLoaded();

        if (const auto it = m_cache.relationships.find(name); it != m_cache.relationships.end())
            return it->second;

        if (const auto it = m_cache.inlineRelationships.find(name); it != m_cache.inlineRelationships.end())
            return it->second;

        for (const auto &[_, meta]: m_cache.inlineRelationships) {
            if (meta->name == name)
                return meta;
        }

        logger::warn("Relationship metadata `{}` not found in cache", name);
        throw NotFoundError("relationship", name, keysOf(allRelationships()));
    }

    std::vector<std::string> MetadataEngine::availableEntities() {
        ensureLoaded();
        return keysOf(m_cache.entities);
    }

    bool MetadataEngine::entityExists(const std::string &name) {
        ensureLoaded();
        return m_cache.entities.contains(resolveEntityIdentifier(name));
    }

    std::map<std::string, RelationshipMetadataPtr> MetadataEngine::allRelationships() {
        ensureLoaded();

        auto all = m_cache.relationships;
        for (const auto &[key, meta]: m_cache.inlineRelationships)
            all.emplace(key, meta);
        return all;
    }

    const std::vector<FieldTypeDescriptor> &MetadataEngine::fieldTypeDefinitions() {
        ensureLoaded();
        return m_cache.fieldTypes;
    }

    const std::vector<ValidationRuleDescriptor> &MetadataEngine::validationRuleDefinitions() {
        ensureLoaded();
        return m_cache.validationRules;
    }

    nlohmann::ordered_json MetadataEngine::entitySummaries() {
        ensureLoaded();

        auto out = json::array();
        for (const auto &[_, meta]: m_cache.entities)
            out.push_back(meta->summary());
        return out;
    }

    const FieldList &MetadataEngine::coreFieldsMetadata() {
        return m_coreFields.standardCoreFields();
    }

    void MetadataEngine::clearCacheForEntity(const std::string &name) {
        const auto resolved = resolveEntityIdentifier(name);

        m_cache.entities.erase(resolved);
        m_cache.relationships.erase(resolved);
        std::erase_if(m_cache.inlineRelationships, [&](const auto &item) {
            return item.second->ownerEntity == resolved;
        });

        m_coreFields.clearCacheForModel(resolved);
        m_cacheFileAllowed = false;
        m_state = CacheState::Cold;

        logger::info("Cache cleared for entity `{}`", resolved);
    }

    void MetadataEngine::clearAllCaches() {
        m_cache = MetadataCache{};
        m_coreFields.clearCache();
        m_cacheFileAllowed = false;
        m_state = CacheState::Cold;

        logger::info("All metadata caches cleared");
    }

    const MetadataCache &MetadataEngine::reload() {
        clearAllCaches();
        return loadAllMetadata();
    }

    CacheState MetadataEngine::state() const { return m_state; }

    std::string MetadataEngine::resolveEntityIdentifier(const std::string &raw) {
        auto name = trim(raw);

        std::size_t start = 0;
        for (std::size_t i = 0; i < name.size(); ++i) {
            const char c = name[i];
            if (c == '\\' || c == '/' || c == '.') {
                start = i + 1;
            } else if (c == ':' && i + 1 < name.size() && name[i + 1] == ':') {
                start = i + 2;
                ++i;
            }
        }
        return name.substr(std::min(start, name.size()));
    }

    std::string MetadataEngine::buildEntityMetadataPath(const std::string &name) const {
        const auto lower = toLower(resolveEntityIdentifier(name));
        return (fs::path(m_config.modelsDir()) / lower / (lower + kMetadataSuffix)).string();
    }

    std::string MetadataEngine::buildRelationshipMetadataPath(const std::string &name) const {
        const auto lower = toLower(name);
        return (fs::path(m_config.relationshipsDir()) / lower / (lower + kMetadataSuffix)).string();
    }

    std::string MetadataEngine::cacheFilePath() const {
        return (fs::path(m_config.cacheDir()) / kCacheFileName).string();
    }

    const Config &MetadataEngine::config() const { return m_config; }

    CoreFieldsProvider &MetadataEngine::coreFields() { return m_coreFields; }

    FieldFactory &MetadataEngine::fieldFactory() { return m_fieldFactory; }

    ValidationRuleFactory &MetadataEngine::validationRuleFactory() { return m_ruleFactory; }

    OptionsRegistry &MetadataEngine::optionsRegistry() { return m_options; }

    void MetadataEngine::ensureLoaded() {
        if (m_state != CacheState::Warm)
            loadAllMetadata();
    }

    bool MetadataEngine::loadFromCacheFile() {
        const auto path = cacheFilePath();

        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
            return false;

        const auto data = readJsonFile(path);
        if (!data.has_value())
            return false;

        try {
            auto cache = MetadataCache::fromJSON(data.value());
            if (cache.empty()) {
                logger::debug("Metadata cache file `{}` is empty, rescanning", path);
                return false;
            }

            for (const auto &[name, meta]: cache.entities) {
                if (!meta->parent().empty())
                    m_coreFields.declareParent(name, meta->parent());
            }

            m_cache = std::move(cache);
        } catch (const std::exception &e) {
            logger::warn("Ignoring metadata cache file `{}`: {}", path, e.what());
            return false;
        }

        logger::debug("Using cached metadata from `{}`", path);
        return true;
    }

    void MetadataEngine::loadFromSources() {
        logger::info("Rebuilding metadata cache from `{}` and `{}`",
                     m_config.modelsDir(), m_config.relationshipsDir());

        MetadataCache cache;

        // Parse every entity before merging, ancestry must be complete first
        std::vector<EntityMetadata> parsed;
        for (const auto &[key, data]: scanMetadataDir(m_config.modelsDir(), true)) {
            try {
                parsed.push_back(EntityMetadata::fromJSON(data));
            } catch (const SchemaError &e) {
                logger::warn("Skipping entity metadata `{}`: {}", key, e.what());
            }
        }

        for (const auto &meta: parsed) {
            if (!meta.parent().empty())
                m_coreFields.declareParent(meta.name(), meta.parent());
        }

        for (auto &meta: parsed) {
            meta.mergeCoreFields(m_coreFields.allCoreFieldsForModel(meta.name()));
            resolveDynamicOptions(meta);

            if (const auto err = meta.validate(); err.has_value()) {
                logger::warn("Skipping invalid entity `{}`: {}", meta.name(), err.value());
                continue;
            }

            for (const auto &[rel_name, definition]: meta.inlineRelationships().items()) {
                try {
                    auto rel = RelationshipResolver::resolve(definition, m_coreFields, meta.name());
                    cache.inlineRelationships[std::format("{}.{}", meta.name(), rel_name)] =
                            std::make_shared<const RelationshipMetadata>(std::move(rel));
                } catch (const SchemaError &e) {
                    logger::warn("Skipping relationship `{}` of `{}`: {}", rel_name, meta.name(), e.what());
                }
            }

            const auto name = meta.name();
            cache.entities[name] = std::make_shared<const EntityMetadata>(std::move(meta));
        }

        for (const auto &[key, data]: scanMetadataDir(m_config.relationshipsDir(), false)) {
            try {
                auto rel = RelationshipResolver::resolve(data, m_coreFields);
                const auto name = rel.name;
                cache.relationships[name] = std::make_shared<const RelationshipMetadata>(std::move(rel));
            } catch (const SchemaError &e) {
                logger::warn("Skipping relationship metadata `{}`: {}", key, e.what());
            }
        }

        cache.validationRules = m_ruleCatalog.discover();
        cache.fieldTypes = m_fieldTypeCatalog.discover();

        validateCache(cache);
        m_cache = std::move(cache);

        if (m_config.cacheEnabled())
            writeCacheFile();
    }

    std::map<std::string, nlohmann::ordered_json> MetadataEngine::scanMetadataDir(const std::string &dir_path,
                                                                          const bool fill_name) const {
        std::map<std::string, json> out;

        std::error_code ec;
        if (!fs::is_directory(dir_path, ec)) {
            logger::warn("Metadata directory `{}` not found", dir_path);
            return out;
        }

        const std::string suffix = kMetadataSuffix;
        for (const auto &sub: fs::directory_iterator(dir_path, ec)) {
            if (!sub.is_directory()) continue;

            for (const auto &entry: fs::directory_iterator(sub.path(), ec)) {
                const auto file_name = entry.path().filename().string();
                if (!entry.is_regular_file() || !hasSuffix(file_name, suffix)) continue;

                auto data = readJsonFile(entry.path());
                if (!data.has_value() || !data->is_object()) {
                    logger::warn("Invalid metadata format in file `{}`", entry.path().string());
                    continue;
                }

                const auto stem = file_name.substr(0, file_name.size() - suffix.size());
                const auto key = data->contains("name") && (*data)["name"].is_string()
                                     ? (*data)["name"].get<std::string>()
                                     : stem;
                if (fill_name && !data->contains("name"))
                    (*data)["name"] = key;

                if (out.contains(key)) {
                    logger::warn("Duplicate metadata `{}` in `{}`, keeping the first one", key,
                                 entry.path().string());
                    continue;
                }
                out.emplace(key, std::move(data.value()));
            }
        }

        if (ec)
            logger::warn("Error while scanning `{}`: {}", dir_path, ec.message());

        return out;
    }

    void MetadataEngine::resolveDynamicOptions(EntityMetadata &meta) const {
        for (auto &field: meta.mutableFields()) {
            if (field.optionsProvider().empty()) continue;

            if (const auto options = m_options.resolve(field.optionsProvider()); options.has_value()) {
                field.setOptions(options.value());
            } else {
                logger::warn("Field `{}.{}` gets no options from provider `{}`",
                             meta.name(), field.name(), field.optionsProvider());
                field.setOptions(json::object());
            }
        }
    }

    void MetadataEngine::validateCache(const MetadataCache &cache) const {
        logger::debug("Validating metadata");

        for (const auto &[name, meta]: cache.entities) {
            for (const auto &field: meta->fields()) {
                for (const auto &rule: field.validationRules()) {
                    if (!m_ruleFactory.has(rule))
                        logger::warn("Field `{}.{}` names unknown validation rule `{}`", name, field.name(), rule);
                }
                if (!field.relatedModel().empty() && !cache.entities.contains(field.relatedModel()))
                    logger::debug("Field `{}.{}` relates to `{}`, which has no metadata",
                                  name, field.name(), field.relatedModel());
            }

            for (const auto &rel: meta->relationshipNames()) {
                if (!cache.relationships.contains(rel)
                    && !cache.inlineRelationships.contains(std::format("{}.{}", name, rel)))
                    logger::warn("Entity `{}` references unknown relationship `{}`", name, rel);
            }
        }
    }

    void MetadataEngine::writeCacheFile() const {
        const auto path = cacheFilePath();
        if (writeJsonFile(path, m_cache.toJSON()))
            logger::info("Metadata cache written to `{}`", path);
        else
            logger::warn("Failed to write metadata cache file `{}`", path);
    }
} // mdb
