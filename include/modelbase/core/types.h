/**
 * @file types.h
 * @brief Shared type aliases.
 */

#ifndef MODELBASE_TYPES_H
#define MODELBASE_TYPES_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mdb {
    using json = nlohmann::ordered_json;

    using Record = nlohmann::ordered_json;  ///< Single database row as a JSON object
    using Records = std::vector<Record>;  ///< Collection of database rows

    /// Column names, as used for projections and listing configuration.
    using FieldNames = std::vector<std::string>;
}

#endif //MODELBASE_TYPES_H
