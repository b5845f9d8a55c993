#ifndef MODELBASE_TEST_CONFIG_H
#define MODELBASE_TEST_CONFIG_H

#include <filesystem>
#include <string>

#include "modelbase/utils/utils.h"

#ifndef MODELBASE_TEST_FIXTURES_DIR
#define MODELBASE_TEST_FIXTURES_DIR "tests/fixtures"
#endif

#ifndef MODELBASE_RESOURCES_DIR
#define MODELBASE_RESOURCES_DIR "resources"
#endif

namespace TestConfig {
    /**
     * @brief Schema fixtures, `models/` and `relationships/` live below it
     */
    inline std::filesystem::path fixturesDir() {
        return MODELBASE_TEST_FIXTURES_DIR;
    }

    inline std::string modelsDir() {
        return (fixturesDir() / "models").string();
    }

    inline std::string relationshipsDir() {
        return (fixturesDir() / "relationships").string();
    }

    /**
     * @brief The core fields template shipped with the library
     */
    inline std::string coreFieldsTemplate() {
        return (std::filesystem::path(MODELBASE_RESOURCES_DIR) / "core_fields_metadata.json").string();
    }

    /**
     * @brief Per-run scratch directory, removed when the test run ends
     */
    inline std::filesystem::path scratchDir() {
        static const auto dir = std::filesystem::temp_directory_path()
                                / ("modelbase_tests_" + mdb::generateShortId(8));
        return dir;
    }
}

#endif //MODELBASE_TEST_CONFIG_H
