#include "../include/modelbase/app.h"
#include "../include/modelbase/core/exceptions.h"
#include "../include/modelbase/utils/utils.h"

namespace mdb {
    ModelBaseApp::ModelBaseApp(const int argc, char **argv) {
        for (int i = 0; i < argc; ++i)
            m_cmdArgs.emplace_back(argv[i]);
    }

    ModelBaseApp::ModelBaseApp(std::vector<std::string> args)
        : m_cmdArgs(std::move(args)) {
        if (m_cmdArgs.empty())
            m_cmdArgs.emplace_back("modelbase");
    }

    int ModelBaseApp::run(std::ostream &out) {
        Logger::init();

        try {
            return parseArgs(out);
        } catch (const NotFoundError &e) {
            logger::critical("{}", e.what());
            std::cerr << json{
                {"error", e.what()},
                {"code", e.code()},
                {"requested", e.requested()},
                {"available", e.available()}
            }.dump(2) << std::endl;
        } catch (const ModelBaseException &e) {
            logger::critical("{}", e.what());
            std::cerr << json{
                {"error", e.what()},
                {"code", e.code()},
                {"description", e.desc()}
            }.dump(2) << std::endl;
        } catch (const std::exception &e) {
            logger::critical("Unexpected error: {}", e.what());
            std::cerr << json{{"error", e.what()}, {"code", 500}}.dump(2) << std::endl;
        }
        return 1;
    }

    bool ModelBaseApp::isDevMode() const { return m_isDevMode; }

    MetadataEngine *ModelBaseApp::engine() const { return m_engine.get(); }

    std::string ModelBaseApp::appVersion() {
        return std::format("{}.{}.{}", MODELBASE_VERSION_MAJOR, MODELBASE_VERSION_MINOR, MODELBASE_VERSION_PATCH);
    }
} // mdb
