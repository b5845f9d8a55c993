/**
 * @file model_context.h
 * @brief Collaborators shared by models and relationships.
 */

#ifndef MODELBASE_MODEL_CONTEXT_H
#define MODELBASE_MODEL_CONTEXT_H

#include <functional>
#include <string>

namespace mdb {
    class MetadataEngine;
    class DatabaseConnector;

    struct ModelContext {
        MetadataEngine &engine;
        DatabaseConnector &db;
        /// Id of the acting user; `system` is recorded when unset or empty.
        std::function<std::string()> currentUser = nullptr;

        [[nodiscard]] std::string userId() const {
            if (currentUser) {
                if (auto id = currentUser(); !id.empty())
                    return id;
            }
            return "system";
        }
    };
} // mdb

#endif //MODELBASE_MODEL_CONTEXT_H
