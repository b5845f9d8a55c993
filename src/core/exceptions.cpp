#include "../../include/modelbase/core/exceptions.h"

#include <numeric>

namespace mdb {
    ModelBaseException::ModelBaseException(const int _code, std::string _msg)
        : m_code(_code),
          m_msg(std::move(_msg)) {
    }

    ModelBaseException::ModelBaseException(const int _code, std::string _msg, std::string _desc)
        : m_code(_code),
          m_msg(std::move(_msg)),
          m_desc(std::move(_desc)) {
    }

    const char *ModelBaseException::what() const noexcept {
        return m_msg.c_str();
    }

    const char *ModelBaseException::desc() const noexcept {
        return m_desc.c_str();
    }

    int ModelBaseException::code() const noexcept {
        if (m_code < 0) return 500;
        return m_code;
    }

    ConfigurationError::ConfigurationError(std::string _msg, std::string _desc)
        : ModelBaseException(500, std::move(_msg), std::move(_desc)) {
    }

    SchemaError::SchemaError(std::string _msg, std::string _desc)
        : ModelBaseException(400, std::move(_msg), std::move(_desc)) {
    }

    namespace {
        std::string joinNames(const std::vector<std::string> &names) {
            if (names.empty()) return "<none>";
            return std::accumulate(std::next(names.begin()), names.end(), names.front(),
                                   [](std::string acc, const std::string &n) { return std::move(acc) + ", " + n; });
        }
    }

    NotFoundError::NotFoundError(std::string kind, std::string requested, std::vector<std::string> available)
        : ModelBaseException(404,
                             "No " + kind + " named `" + requested + "` was found",
                             "Available: " + joinNames(available)),
          m_kind(std::move(kind)),
          m_requested(std::move(requested)),
          m_available(std::move(available)) {
    }

    const std::string &NotFoundError::kind() const noexcept {
        return m_kind;
    }

    const std::string &NotFoundError::requested() const noexcept {
        return m_requested;
    }

    const std::vector<std::string> &NotFoundError::available() const noexcept {
        return m_available;
    }

    ConstraintError::ConstraintError(std::string _msg, std::string _desc)
        : ModelBaseException(409, std::move(_msg), std::move(_desc)) {
    }
} // mdb
