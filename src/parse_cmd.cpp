#include "../include/modelbase/app.h"
#include "../include/modelbase/core/config.h"
#include "../include/modelbase/core/exceptions.h"
#include "../include/modelbase/utils/utils.h"

#include <argparse/argparse.hpp>

namespace mdb {
    namespace {
        json describeEntity(MetadataEngine &engine, const std::string &name) {
            const auto meta = engine.entityMetadata(name);

            auto data = meta->toJSON();

            auto sort = json::array();
            for (const auto &spec: meta->defaultSort())
                sort.push_back({{"field", spec.field}, {"direction", spec.direction}});

            data["listing"] = {
                {"searchableFields", meta->searchableFields()},
                {"sortableFields", meta->sortableFields()},
                {"defaultSort", sort},
                {"pagination", meta->pagination().toJSON()}
            };
            return data;
        }
    }

    int ModelBaseApp::parseArgs(std::ostream &out) {
        // Main program parser with global arguments
        argparse::ArgumentParser program("modelbase", appVersion());
        program.add_argument("--config", "-c")
                .nargs(1)
                .help("<file> JSON config file.");
        program.add_argument("--modelsDir")
                .nargs(1)
                .help("<dir> Entity schema directory (default: ./models)");
        program.add_argument("--relationshipsDir")
                .nargs(1)
                .help("<dir> Relationship schema directory (default: ./relationships)");
        program.add_argument("--cacheDir")
                .nargs(1)
                .help("<dir> Metadata cache directory (default: ./cache)");
        program.add_argument("--noCache")
                .flag()
                .help("Neither read nor write the metadata cache file");
        program.add_argument("--dev").flag();

        argparse::ArgumentParser entities_command("entities");
        entities_command.add_description("List entities with their table and field counts");

        argparse::ArgumentParser describe_command("describe");
        describe_command.add_description("Print the resolved metadata of one entity");
        describe_command.add_argument("name")
                .help("Entity name, case-sensitive");

        argparse::ArgumentParser relationships_command("relationships");
        relationships_command.add_description("Print all resolved relationships");

        argparse::ArgumentParser field_types_command("field-types");
        field_types_command.add_description("Print the available field types");

        argparse::ArgumentParser rules_command("validation-rules");
        rules_command.add_description("Print the available validation rules");

        argparse::ArgumentParser rebuild_command("rebuild-cache");
        rebuild_command.add_description("Rescan the schema directories and rewrite the cache file");

        program.add_subparser(entities_command);
        program.add_subparser(describe_command);
        program.add_subparser(relationships_command);
        program.add_subparser(field_types_command);
        program.add_subparser(rules_command);
        program.add_subparser(rebuild_command);

        try {
            // Create a vector of `const char*` pointing to the owned `std::string`s
            std::vector<const char *> argv;
            argv.reserve(m_cmdArgs.size());
            for (const auto &arg: m_cmdArgs) {
                argv.push_back(arg.c_str());
            }

            program.parse_args(static_cast<int>(argv.size()), argv.data());
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::cerr << program << std::endl;
            return 2;
        }

        // Config file first, then command line overrides on top
        auto config = program.present<std::string>("--config").has_value()
                          ? Config::fromFile(program.get<std::string>("--config"))
                          : Config();

        if (const auto dir = program.present<std::string>("--modelsDir"))
            config.set("metadata.models_dir_path", dir.value());
        if (const auto dir = program.present<std::string>("--relationshipsDir"))
            config.set("metadata.relationships_dir_path", dir.value());
        if (const auto dir = program.present<std::string>("--cacheDir"))
            config.set("metadata.cache_dir_path", dir.value());
        if (program.get<bool>("--noCache"))
            config.set("metadata.cache_enabled", false);

        Logger::setLogLevel(Logger::levelFromString(config.logLevel()));

        // Set trace mode if flag is set
        if (program.get<bool>("--dev")) {
            logger::setLogLevel(LogLevel::TRACE);
            m_isDevMode = true;
        }

        logger::debug("modelbase v{}, models in `{}`, relationships in `{}`",
                      appVersion(), config.modelsDir(), config.relationshipsDir());

        m_engine = std::make_unique<MetadataEngine>(std::move(config));
        auto &engine = *m_engine;

        json result;
        if (program.is_subcommand_used("entities")) {
            result = engine.entitySummaries();
        } else if (program.is_subcommand_used("describe")) {
            result = describeEntity(engine, describe_command.get<std::string>("name"));
        } else if (program.is_subcommand_used("relationships")) {
            result = json::object();
            for (const auto &[key, meta]: engine.allRelationships())
                result[key] = meta->toJSON();
        } else if (program.is_subcommand_used("field-types")) {
            result = json::array();
            for (const auto &ft: engine.fieldTypeDefinitions())
                result.push_back(ft.toJSON());
        } else if (program.is_subcommand_used("validation-rules")) {
            result = json::array();
            for (const auto &rule: engine.validationRuleDefinitions())
                result.push_back(rule.toJSON());
        } else if (program.is_subcommand_used("rebuild-cache")) {
            const auto &cache = engine.reload();
            result = {
                {"entities", cache.entities.size()},
                {"relationships", cache.relationships.size() + cache.inlineRelationships.size()},
                {"field_types", cache.fieldTypes.size()},
                {"validation_rules", cache.validationRules.size()},
                {"cache_file", engine.config().cacheEnabled() ? engine.cacheFilePath() : ""}
            };
        } else {
            std::cerr << program << std::endl;
            return 2;
        }

        out << result.dump(2) << std::endl;
        return 0;
    }
} // mdb
