/**
 * @file app.h
 *
 * @brief The `modelbase` command line application.
 *
 * Parses the command line, builds the configuration and the metadata engine,
 * and runs one inspection command, printing its result as JSON.
 */

#ifndef MODELBASE_APP_H
#define MODELBASE_APP_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "metadata/metadata_engine.h"

namespace mdb {
    /**
     * @brief `modelbase` entry point.
     *
     * Global options:
     * - `--config <file>` JSON config file
     * - `--modelsDir`, `--relationshipsDir`, `--cacheDir` override the config
     * - `--noCache` neither reads nor writes the metadata cache file
     * - `--dev` trace logging
     *
     * Commands: `entities`, `describe <name>`, `relationships`, `field-types`,
     * `validation-rules`, `rebuild-cache`.
     *
     * @code
     * ModelBaseApp app({"modelbase", "--modelsDir", "schemas/models", "describe", "Movies"});
     * return app.run();
     * @endcode
     */
    class ModelBaseApp {
    public:
        ModelBaseApp(int argc, char **argv);

        explicit ModelBaseApp(std::vector<std::string> args);

        ModelBaseApp(const ModelBaseApp &) = delete;

        ModelBaseApp &operator=(const ModelBaseApp &) = delete;

        /**
         * @brief Parse the arguments and run the selected command.
         * @param out Stream receiving the JSON result
         * @return `0` on success, else a non-zero exit code.
         */
        [[nodiscard]] int run(std::ostream &out = std::cout);

        [[nodiscard]] bool isDevMode() const;

        /// Engine built by `run()`, `nullptr` before.
        [[nodiscard]] MetadataEngine *engine() const;

        static std::string appVersion();

    private:
        int parseArgs(std::ostream &out);

        std::vector<std::string> m_cmdArgs;
        std::unique_ptr<MetadataEngine> m_engine;
        bool m_isDevMode = false;
    };
} // mdb

#endif // MODELBASE_APP_H
