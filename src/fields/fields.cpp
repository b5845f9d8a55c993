#include "../../include/modelbase/fields/fields.h"
#include "../../include/modelbase/utils/utils.h"

#include <cmath>

namespace mdb {
    namespace {
        std::vector<std::string> withBase(std::initializer_list<std::string> extra) {
            auto ops = baseOperators();
            ops.insert(ops.end(), extra);
            return ops;
        }

        const std::vector<std::string> &numericOperators() {
            static const std::vector<std::string> ops = withBase({
                "greaterThan", "greaterThanOrEqual", "lessThan", "lessThanOrEqual", "between", "in", "notIn"
            });
            return ops;
        }

        std::optional<std::string> checkBounds(const FieldDescriptor &field, const double value) {
            if (const auto min = field.extra("minValue"); min.is_number() && value < min.get<double>())
                return std::format("{} must be >= {}", field.name(), min.dump());
            if (const auto max = field.extra("maxValue"); max.is_number() && value > max.get<double>())
                return std::format("{} must be <= {}", field.name(), max.dump());
            return std::nullopt;
        }
    }

    // ----------------- ID ---------------------- //

    std::vector<std::string> IDField::defaultOperators() const {
        return withBase({"in", "notIn"});
    }

    std::optional<std::string> IDField::checkType(const nlohmann::ordered_json &value) const {
        if (!(value.is_string() || value.is_number_integer()))
            return std::format("{} expects a string or integer id", name());
        return std::nullopt;
    }

    // ----------------- TEXT ---------------------- //

    std::vector<std::string> TextField::defaultOperators() const {
        return withBase({"contains", "startsWith", "endsWith", "in", "notIn"});
    }

    std::optional<std::string> TextField::checkType(const nlohmann::ordered_json &value) const {
        if (!value.is_string())
            return std::format("{} expects a string value", name());

        if (const auto max = m_descriptor.extra("maxLength"); max.is_number_integer()
                                                               && value.get<std::string>().size() > max.get<size_t>())
            return std::format("{} must be at most {} characters", name(), max.get<size_t>());
        return std::nullopt;
    }

    std::vector<std::string> BigTextField::defaultOperators() const {
        return withBase({"contains", "startsWith", "endsWith"});
    }

    // ----------------- NUMBERS ---------------------- //

    std::vector<std::string> IntegerField::defaultOperators() const {
        return numericOperators();
    }

    std::optional<std::string> IntegerField::checkType(const nlohmann::ordered_json &value) const {
        if (!value.is_number_integer())
            return std::format("{} expects an integer value", name());
        return checkBounds(m_descriptor, value.get<double>());
    }

    nlohmann::ordered_json IntegerField::normalize(const nlohmann::ordered_json &value) const {
        if (value.is_string()) {
            const auto str = trim(value.get<std::string>());
            try {
                size_t pos = 0;
                const auto parsed = std::stoll(str, &pos);
                if (pos == str.size()) return parsed;
            } catch (const std::exception &) {
                // Not numeric, left for checkType to reject
            }
        }
        if (value.is_number_float()) {
            if (const auto d = value.get<double>(); std::floor(d) == d)
                return static_cast<int64_t>(d);
        }
        return value;
    }

    std::vector<std::string> FloatField::defaultOperators() const {
        return numericOperators();
    }

    std::optional<std::string> FloatField::checkType(const nlohmann::ordered_json &value) const {
        if (!value.is_number())
            return std::format("{} expects a numeric value", name());
        return checkBounds(m_descriptor, value.get<double>());
    }

    nlohmann::ordered_json FloatField::normalize(const nlohmann::ordered_json &value) const {
        if (value.is_string()) {
            const auto str = trim(value.get<std::string>());
            try {
                size_t pos = 0;
                const auto parsed = std::stod(str, &pos);
                if (pos == str.size()) return parsed;
            } catch (const std::exception &) {
                // Not numeric, left for checkType to reject
            }
        }
        return value;
    }

    // ----------------- BOOLEAN ---------------------- //

    std::optional<std::string> BooleanField::checkType(const nlohmann::ordered_json &value) const {
        if (!value.is_boolean())
            return std::format("{} expects a boolean value", name());
        return std::nullopt;
    }

    nlohmann::ordered_json BooleanField::normalize(const nlohmann::ordered_json &value) const {
        if (value.is_number_integer() && (value == 0 || value == 1))
            return value == 1;
        if (value.is_string()) {
            const auto str = toLower(trim(value.get<std::string>()));
            if (str == "1" || str == "true" || str == "yes" || str == "on") return true;
            if (str == "0" || str == "false" || str == "no" || str == "off") return false;
        }
        return value;
    }

    // ----------------- DATES ---------------------- //

    std::vector<std::string> DateField::defaultOperators() const {
        return withBase({"greaterThan", "greaterThanOrEqual", "lessThan", "lessThanOrEqual", "between"});
    }

    // ----------------- CHOICES ---------------------- //

    std::vector<std::string> EnumField::defaultOperators() const {
        return withBase({"in", "notIn"});
    }

    std::vector<std::string> MultiEnumField::defaultOperators() const {
        return withBase({"contains", "in", "notIn"});
    }

    std::optional<std::string> MultiEnumField::checkType(const nlohmann::ordered_json &value) const {
        if (!value.is_array())
            return std::format("{} expects an array of options", name());
        for (const auto &item: value) {
            if (!item.is_string())
                return std::format("{} expects an array of string options", name());
        }
        return std::nullopt;
    }

    // ----------------- RELATIONS ---------------------- //

    std::vector<std::string> RelatedRecordField::defaultOperators() const {
        return withBase({"in", "notIn"});
    }

    std::optional<std::string> RelatedRecordField::checkType(const nlohmann::ordered_json &value) const {
        if (!(value.is_string() || value.is_number_integer()))
            return std::format("{} expects the id of a `{}` record", name(), m_descriptor.relatedModel());
        return std::nullopt;
    }

    // ----------------- PASSWORD ---------------------- //

    std::vector<std::string> PasswordField::defaultOperators() const {
        return {"isNull", "isNotNull"};
    }
} // mdb
