/**
 * @file exceptions.h
 * @brief Exception types raised by the modelbase library.
 *
 * Every error carries an HTTP-like status code, a message and an optional
 * description, so callers on a transport layer can map them directly.
 */

#ifndef MODELBASE_EXCEPTIONS_H
#define MODELBASE_EXCEPTIONS_H

#include <exception>
#include <string>
#include <vector>

namespace mdb {
    /**
     * @brief Base exception for all modelbase errors.
     */
    class ModelBaseException : public std::exception {
    public:
        ModelBaseException(int _code, std::string _msg);

        ModelBaseException(int _code, std::string _msg, std::string _desc);

        [[nodiscard]] const char *what() const noexcept override;

        [[nodiscard]] const char *desc() const noexcept;

        [[nodiscard]] int code() const noexcept;

    private:
        int m_code = -1;
        std::string m_msg, m_desc;
    };

    /**
     * @brief Raised when a required resource (core field template, config file)
     * is missing or malformed. Fatal for the operation that triggered it.
     */
    class ConfigurationError final : public ModelBaseException {
    public:
        explicit ConfigurationError(std::string _msg, std::string _desc = "");
    };

    /**
     * @brief Raised on structural validation failures of schema data, such as a
     * relationship without `type` or an unknown cascade action.
     */
    class SchemaError final : public ModelBaseException {
    public:
        explicit SchemaError(std::string _msg, std::string _desc = "");
    };

    /**
     * @brief Raised when a cache lookup misses.
     *
     * Carries the requested name together with the names that are available,
     * which makes "did you mean" style reporting possible upstream.
     */
    class NotFoundError final : public ModelBaseException {
    public:
        NotFoundError(std::string kind, std::string requested, std::vector<std::string> available);

        /// What was looked up, e.g. `entity` or `relationship`.
        [[nodiscard]] const std::string &kind() const noexcept;

        [[nodiscard]] const std::string &requested() const noexcept;

        [[nodiscard]] const std::vector<std::string> &available() const noexcept;

    private:
        std::string m_kind, m_requested;
        std::vector<std::string> m_available;
    };

    /**
     * @brief Raised when a restrict cascade policy blocks a deletion.
     */
    class ConstraintError final : public ModelBaseException {
    public:
        explicit ConstraintError(std::string _msg, std::string _desc = "");
    };
} // mdb

#endif //MODELBASE_EXCEPTIONS_H
