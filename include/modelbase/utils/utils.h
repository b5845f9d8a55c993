/**
 * @file utils.h
 *
 * @brief Collection of utility functions that are re-used across different files.
 */

#ifndef MODELBASE_UTILS_H
#define MODELBASE_UTILS_H

#include <string>
#include <filesystem>
#include <optional>
#include <random>
#include <chrono>
#include <string_view>
#include <algorithm>
#include <vector>
#include <format>
#include <nlohmann/json.hpp>

#include "../core/logger.h"

namespace mdb {
    namespace fs = std::filesystem; ///< Use shorthand `fs` to refer to the `std::filesystem`
    using json = nlohmann::ordered_json; ///> JSON convenience, objects keep their declared key order

    // ----------------------------------------------------------------- //
    // PATH UTILS
    // ----------------------------------------------------------------- //

    /**
     * Resolves given path as a string to an absolute path, relative to the `cwd`.
     *
     * @param input_path The path to resolve
     * @return Returns an absolute filesystem path.
     */
    fs::path resolvePath(const std::string &input_path);

    /**
     * @brief Create directory, given a path
     *
     * Creates the target directory, including any missing parent directories.
     *
     * @param path The directory path to create like `/foo/bar`.
     * @return True if the directory exists after the call.
     */
    bool createDirs(const fs::path &path);

    /**
     * @brief Read and parse a JSON file.
     *
     * Parse errors and unreadable files are logged, never thrown.
     *
     * @param path File to read
     * @return Parsed JSON value, `std::nullopt` on failure.
     */
    std::optional<json> readJsonFile(const fs::path &path);

    /**
     * @brief Serialize JSON to a file, creating parent directories as needed.
     * @param path Target file
     * @param data JSON value to write
     * @return true if the whole document was written.
     */
    bool writeJsonFile(const fs::path &path, const json &data);

    // ----------------------------------------------------------------- //
    // STRING UTILS
    // ----------------------------------------------------------------- //
    /**
     * @brief Converts a string to its lowercase variant.
     *
     * It converts the string in place.
     *
     * @param str The string to convert.
     */
    void toLowerCase(std::string &str);

    /// Lowercased copy of `str`.
    std::string toLower(std::string str);

    /**
     * @brief Trims leading and trailing whitespaces from a string.
     *
     * @param s The string to trim.
     * @return String with all leading and trailing whitespaces removed.
     */
    std::string trim(const std::string &s);

    /**
     * @brief Convert given string value to boolean type.
     *
     * `1`, `true`, `yes` and `on` are true, anything else is false.
     */
    bool strToBool(const std::string &value);

    /**
     * @brief Generates a short alphanumeric id.
     *
     * Sample Output: `Fz8xYc6a7LQw`
     */
    std::string generateShortId(size_t length = 16);

    /**
     * @brief Split given string based on given delimiter
     *
     * @param input Input string to split.
     * @param delimiter The string delimiter to use to split the `input` string.
     * @return A vector of strings.
     *
     * @code
     * auto parts = splitString("Hello, John!", ",");
     * // > Should be a vector of two strings `Hello` and ` John!`
     * @endcode
     */
    std::vector<std::string> splitString(const std::string &input, const std::string &delimiter);

    /**
     * @brief Retrieves a value from an environment variable or a default value if the env variable was not set.
     * @param key Environment variable key.
     * @param defaultValue A default value if the key is not set.
     * @return The env value if found, else the default value passed in.
     */
    std::string getEnvOrDefault(const std::string &key, const std::string &defaultValue);

    /**
     * @brief Whether `str` ends with `suffix`, and the remainder is non-empty.
     */
    bool hasSuffix(const std::string &str, const std::string &suffix);

    /**
     * @brief Split a CamelCase identifier into lowercase words.
     *
     * `DateTimeField` becomes `date time field`, `IDField` becomes `id field`.
     */
    std::string camelCaseToWords(const std::string &identifier);

    // ----------------------------------------------------------------- //
    // DATE UTILS
    // ----------------------------------------------------------------- //

    /**
     * @brief Current local time formatted as `YYYY-MM-DD HH:MM:SS`.
     */
    std::string currentDateTime();

    /**
     * @brief Check that a value parses as `YYYY-MM-DD`, optionally followed by a
     * `HH:MM[:SS]` time part separated by a space or `T`.
     * @param value String to check
     * @param requireTime Reject plain dates
     */
    bool isValidDateTime(const std::string &value, bool requireTime = false);
}

#endif // MODELBASE_UTILS_H
