/**
 * @file metadata_engine.h
 * @brief Loads, resolves and caches all entity and relationship metadata.
 *
 * The engine owns the metadata cache and the registries used to resolve it
 * (core fields, field and validation rule factories, dynamic options). One
 * instance is constructed explicitly and handed to consumers by reference.
 *
 * @code
 * MetadataEngine engine(Config::fromFile("modelbase.json"));
 * engine.optionsRegistry().add("Genres::all", [] { return json::array({"Drama", "Comedy"}); });
 *
 * const auto movies = engine.entityMetadata("Movies");
 * for (const auto &field: movies->fields())
 *     std::cout << field.name() << "\n";
 * @endcode
 */

#ifndef MODELBASE_METADATA_ENGINE_H
#define MODELBASE_METADATA_ENGINE_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/config.h"
#include "../catalog/field_type_catalog.h"
#include "../catalog/validation_rule_catalog.h"
#include "../fields/field_factory.h"
#include "../validation/validation_rule_factory.h"
#include "core_fields.h"
#include "entity_metadata.h"
#include "options_registry.h"
#include "relationship_metadata.h"

namespace mdb {
    enum class CacheState : uint8_t {
        Cold = 0,
        Loading,
        Warm
    };

    std::string cacheStateToString(CacheState state);

    using EntityMetadataPtr = std::shared_ptr<const EntityMetadata>;
    using RelationshipMetadataPtr = std::shared_ptr<const RelationshipMetadata>;

    /**
     * @brief Everything the engine resolved in one load.
     *
     * Entries are immutable once published; consumers share them.
     */
    struct MetadataCache {
        std::map<std::string, EntityMetadataPtr> entities;
        /// Standalone relationships keyed by name.
        std::map<std::string, RelationshipMetadataPtr> relationships;
        /// Relationships declared inside entity schemas, keyed `Entity.relationship`.
        std::map<std::string, RelationshipMetadataPtr> inlineRelationships;
        std::vector<FieldTypeDescriptor> fieldTypes;
        std::vector<ValidationRuleDescriptor> validationRules;

        [[nodiscard]] bool empty() const;

        /// Layout of the on-disk cache file.
        [[nodiscard]] nlohmann::ordered_json toJSON() const;

        /**
         * @brief Rebuild a cache from `toJSON()` output.
         * @throws SchemaError on a malformed document.
         */
        static MetadataCache fromJSON(const nlohmann::ordered_json &data);
    };

    class MetadataEngine {
    public:
        explicit MetadataEngine(Config config = Config());

        MetadataEngine(const MetadataEngine &) = delete;

        MetadataEngine &operator=(const MetadataEngine &) = delete;

        /**
         * @brief Load every entity and relationship, once.
         *
         * When warm the cached aggregate is returned without any I/O. Otherwise the
         * on-disk cache file is used if this is the first load of the process,
         * else the schema directories are scanned and resolved. Malformed schema
         * files are logged and left out.
         *
         * @throws ConfigurationError if the core fields template is unusable.
         */
        const MetadataCache &loadAllMetadata();

        /**
         * @brief Metadata of one entity, exact and case-sensitive.
         *
         * Namespace qualifiers are stripped first, see `resolveEntityIdentifier()`.
         *
         * @throws NotFoundError listing the available entities.
         */
        EntityMetadataPtr entityMetadata(const std::string &name);

        /**
         * @brief Metadata of one relationship.
         *
         * Standalone relationships are searched first, then inline ones either by
         * their `Entity.relationship` key or by bare name.
         *
         * @throws NotFoundError listing the available relationships.
         */
        RelationshipMetadataPtr relationshipMetadata(const std::string &name);

        std::vector<std::string> availableEntities();

        bool entityExists(const std::string &name);

        /// Standalone relationships by name plus inline ones keyed `Entity.relationship`.
        std::map<std::string, RelationshipMetadataPtr> allRelationships();

        const std::vector<FieldTypeDescriptor> &fieldTypeDefinitions();

        const std::vector<ValidationRuleDescriptor> &validationRuleDefinitions();

        /// One `{name, table, description, fieldCount, relationshipCount}` object per entity.
        nlohmann::ordered_json entitySummaries();

        const FieldList &coreFieldsMetadata();

        /**
         * @brief Evict one entity and the relationships it declares.
         *
         * The engine turns cold; the next lookup rescans the sources.
         */
        void clearCacheForEntity(const std::string &name);

        /// Drop everything; the on-disk cache file is not consulted again.
        void clearAllCaches();

        /// Clear and load again from the schema sources.
        const MetadataCache &reload();

        [[nodiscard]] CacheState state() const;

        /// `App\Models\Movies`, `app::Movies`, `models/Movies` and `models.Movies` all give `Movies`.
        static std::string resolveEntityIdentifier(const std::string &raw);

        /// `<models dir>/<lower>/<lower>_metadata.json`
        [[nodiscard]] std::string buildEntityMetadataPath(const std::string &name) const;

        /// `<relationships dir>/<lower>/<lower>_metadata.json`
        [[nodiscard]] std::string buildRelationshipMetadataPath(const std::string &name) const;

        [[nodiscard]] std::string cacheFilePath() const;

        [[nodiscard]] const Config &config() const;

        CoreFieldsProvider &coreFields();

        FieldFactory &fieldFactory();

        ValidationRuleFactory &validationRuleFactory();

        OptionsRegistry &optionsRegistry();

    private:
        void ensureLoaded();

        bool loadFromCacheFile();

        void loadFromSources();

        /// `{key -> raw JSON}` of every `<dir>/<sub>/<x>_metadata.json`.
        std::map<std::string, nlohmann::ordered_json> scanMetadataDir(const std::string &dir_path, bool fill_name) const;

        void resolveDynamicOptions(EntityMetadata &meta) const;

        void validateCache(const MetadataCache &cache) const;

        void writeCacheFile() const;

        Config m_config;
        CoreFieldsProvider m_coreFields;
        FieldFactory m_fieldFactory;
        ValidationRuleFactory m_ruleFactory;
        OptionsRegistry m_options;
        ValidationRuleCatalog m_ruleCatalog;
        FieldTypeCatalog m_fieldTypeCatalog;

        MetadataCache m_cache;
        CacheState m_state = CacheState::Cold;
        bool m_cacheFileAllowed = true;
    };
} // mdb

#endif //MODELBASE_METADATA_ENGINE_H
