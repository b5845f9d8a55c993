/**
 * @file main.cpp
 * @brief Standalone `modelbase` executable entrypoint
 */

#include "../include/modelbase/app.h"

/**
 * @brief modelbase standalone entrypoint
 * @param argc Argument count
 * @param argv Argument list
 * @return Non-zero if the command did not complete
 */
int main(const int argc, char *argv[]) {
    mdb::ModelBaseApp app(argc, argv);
    return app.run();
}
