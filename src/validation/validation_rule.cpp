#include "../../include/modelbase/validation/validation_rule.h"
#include "../../include/modelbase/core/database_connector.h"
#include "../../include/modelbase/utils/utils.h"

#include <cctype>
#include <regex>

namespace mdb {
    namespace {
        const std::regex &emailPattern() {
            static const std::regex r(R"(^[a-zA-Z0-9._%+\-]+@[a-zA-Z0-9.\-]+\.[a-zA-Z]{2,}$)");
            return r;
        }

        const std::regex &urlPattern() {
            static const std::regex r(R"(^https?://[^\s/$.?#][^\s]*$)", std::regex::icase);
            return r;
        }

        const std::regex &videoUrlPattern() {
            static const std::regex r(
                R"(^https?://(www\.)?(youtube\.com/watch\?v=|youtu\.be/|youtube\.com/embed/|vimeo\.com/|player\.vimeo\.com/video/)[A-Za-z0-9_\-]+.*$)",
                std::regex::icase);
            return r;
        }

        const std::regex &passwordPattern() {
            static const std::regex r(R"(^(?=.*[a-z])(?=.*[A-Z])(?=.*\d)(?=.*[\W_]).{8,}$)");
            return r;
        }

        std::string labelOf(const RuleContext &ctx) {
            return ctx.field.label().empty() ? ctx.field.name() : ctx.field.label();
        }
    }

    bool ValidationRule::appliesToType(const FieldType type) const {
        const auto types = appliesTo();
        return types.empty() || std::ranges::find(types, type) != types.end();
    }

    bool ValidationRule::isEmptyValue(const json &value) {
        if (value.is_null()) return true;
        if (value.is_string()) return value.get<std::string>().empty();
        if (value.is_array()) return value.empty();
        return false;
    }

    // ----------------- REQUIRED ---------------------- //

    std::string RequiredValidation::description() const {
        return "Field must have a non-empty value";
    }

    std::string RequiredValidation::javascriptValidation() const {
        return "function(value) { return value !== null && value !== undefined && value !== '' "
               "&& !(Array.isArray(value) && value.length === 0); }";
    }

    std::optional<std::string> RequiredValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value))
            return std::format("{} is required", labelOf(ctx));
        return std::nullopt;
    }

    // ----------------- EMAIL ---------------------- //

    std::string EmailValidation::description() const {
        return "Value must be a valid email address";
    }

    std::string EmailValidation::javascriptValidation() const {
        return R"(function(value) { return !value || /^[a-zA-Z0-9._%+\-]+@[a-zA-Z0-9.\-]+\.[a-zA-Z]{2,}$/.test(value); })";
    }

    std::vector<FieldType> EmailValidation::appliesTo() const {
        return {FieldType::Text, FieldType::Email};
    }

    std::optional<std::string> EmailValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (!value.is_string() || !std::regex_match(value.get<std::string>(), emailPattern()))
            return std::format("{} must be a valid email address", labelOf(ctx));
        return std::nullopt;
    }

    // ----------------- ALPHANUMERIC ---------------------- //

    std::string AlphanumericValidation::description() const {
        return "Value may only contain letters and digits";
    }

    std::string AlphanumericValidation::javascriptValidation() const {
        return R"(function(value) { return !value || /^[A-Za-z0-9]+$/.test(value); })";
    }

    std::vector<FieldType> AlphanumericValidation::appliesTo() const {
        return {FieldType::Text, FieldType::BigText};
    }

    std::optional<std::string> AlphanumericValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (!value.is_string())
            return std::format("{} must be a string", labelOf(ctx));

        const auto str = value.get<std::string>();
        if (!std::ranges::all_of(str, [](const unsigned char c) { return std::isalnum(c) != 0; }))
            return std::format("{} may only contain letters and digits", labelOf(ctx));
        return std::nullopt;
    }

    // ----------------- DATETIME ---------------------- //

    std::string DateTimeValidation::description() const {
        return "Value must be a date (YYYY-MM-DD) or date time (YYYY-MM-DD HH:MM:SS)";
    }

    std::string DateTimeValidation::javascriptValidation() const {
        return "function(value) { return !value || !isNaN(Date.parse(value)); }";
    }

    std::vector<FieldType> DateTimeValidation::appliesTo() const {
        return {FieldType::Date, FieldType::DateTime};
    }

    std::optional<std::string> DateTimeValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (!value.is_string() || !isValidDateTime(value.get<std::string>()))
            return std::format("{} must be a valid date/time", labelOf(ctx));
        return std::nullopt;
    }

    // ----------------- OPTIONS ---------------------- //

    std::string OptionsValidation::description() const {
        return "Value must be one of the field's options";
    }

    std::string OptionsValidation::javascriptValidation() const {
        return "function(value, options) { if (!value) return true; "
               "var keys = Array.isArray(options) ? options : Object.keys(options || {}); "
               "return [].concat(value).every(function(v) { return keys.indexOf(String(v)) !== -1; }); }";
    }

    std::vector<FieldType> OptionsValidation::appliesTo() const {
        return {FieldType::Enum, FieldType::MultiEnum, FieldType::RadioButtonSet};
    }

    std::optional<std::string> OptionsValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;

        const auto &options = ctx.field.options();
        if (!(options.is_object() || options.is_array())) {
            logger::debug("Field `{}` has no options, skipping Options validation", ctx.field.name());
            return std::nullopt;
        }

        const auto allowed = [&](const json &v) {
            const auto key = v.is_string() ? v.get<std::string>() : v.dump();
            if (options.is_object()) return options.contains(key);
            return std::any_of(options.begin(), options.end(), [&](const json &o) {
                return o == v || (o.is_string() && o == key);
            });
        };

        const auto values = value.is_array() ? value : json::array({value});
        for (const auto &v: values) {
            if (!allowed(v))
                return std::format("{}: `{}` is not a valid option", labelOf(ctx),
                                   v.is_string() ? v.get<std::string>() : v.dump());
        }
        return std::nullopt;
    }

    // ----------------- URL ---------------------- //

    std::string URLValidation::description() const {
        return "Value must be an http(s) URL";
    }

    std::string URLValidation::javascriptValidation() const {
        return R"(function(value) { return !value || /^https?:\/\/[^\s/$.?#][^\s]*$/i.test(value); })";
    }

    std::vector<FieldType> URLValidation::appliesTo() const {
        return {FieldType::Text, FieldType::Image, FieldType::Video};
    }

    std::optional<std::string> URLValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (!value.is_string() || !std::regex_match(value.get<std::string>(), urlPattern()))
            return std::format("{} must be a valid URL", labelOf(ctx));
        return std::nullopt;
    }

    // ----------------- VIDEO URL ---------------------- //

    std::string VideoURLValidation::description() const {
        return "Value must be a YouTube or Vimeo video URL";
    }

    std::string VideoURLValidation::javascriptValidation() const {
        return R"(function(value) { return !value || /^https?:\/\/(www\.)?(youtube\.com\/watch\?v=|youtu\.be\/|youtube\.com\/embed\/|vimeo\.com\/|player\.vimeo\.com\/video\/)[A-Za-z0-9_\-]+/i.test(value); })";
    }

    std::vector<FieldType> VideoURLValidation::appliesTo() const {
        return {FieldType::Video};
    }

    std::optional<std::string> VideoURLValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (!value.is_string() || !std::regex_match(value.get<std::string>(), videoUrlPattern()))
            return std::format("{} must be a YouTube or Vimeo URL", labelOf(ctx));
        return std::nullopt;
    }

    // ----------------- PASSWORD STRENGTH ---------------------- //

    std::string PasswordStrengthValidation::description() const {
        return "At least 8 characters with a lowercase, an uppercase, a digit and a special character";
    }

    std::string PasswordStrengthValidation::javascriptValidation() const {
        return R"(function(value) { return !value || /^(?=.*[a-z])(?=.*[A-Z])(?=.*\d)(?=.*[\W_]).{8,}$/.test(value); })";
    }

    std::vector<FieldType> PasswordStrengthValidation::appliesTo() const {
        return {FieldType::Password};
    }

    std::optional<std::string> PasswordStrengthValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (!value.is_string() || !std::regex_match(value.get<std::string>(), passwordPattern()))
            return std::format("{}: expected at least one lowercase, uppercase, digit, special character, "
                               "and a min 8 chars.", labelOf(ctx));
        return std::nullopt;
    }

    // ----------------- FOREIGN KEY ---------------------- //

    std::string ForeignKeyExistsValidation::description() const {
        return "Referenced record must exist";
    }

    std::string ForeignKeyExistsValidation::javascriptValidation() const {
        return "function(value) { return true; }";
    }

    std::vector<FieldType> ForeignKeyExistsValidation::appliesTo() const {
        return {FieldType::ID, FieldType::RelatedRecord};
    }

    std::optional<std::string> ForeignKeyExistsValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (ctx.db == nullptr || ctx.relatedTable.empty()) return std::nullopt;

        const auto column = ctx.field.relatedFieldName().empty() ? std::string("id") : ctx.field.relatedFieldName();
        if (!ctx.db->recordExists(ctx.relatedTable, json{{column, value}}))
            return std::format("{}: referenced record `{}` does not exist in `{}`",
                               labelOf(ctx), value.is_string() ? value.get<std::string>() : value.dump(),
                               ctx.relatedTable);
        return std::nullopt;
    }

    // ----------------- UNIQUE ---------------------- //

    std::string UniqueValidation::description() const {
        return "Value must be unique across active records";
    }

    std::string UniqueValidation::javascriptValidation() const {
        return "function(value) { return true; }";
    }

    std::optional<std::string> UniqueValidation::validate(const json &value, const RuleContext &ctx) const {
        if (isEmptyValue(value)) return std::nullopt;
        if (ctx.db == nullptr || ctx.table.empty()) return std::nullopt;

        const json criteria{{ctx.field.name(), value}, {"deleted_at", nullptr}};
        if (!ctx.db->recordExists(ctx.table, criteria))
            return std::nullopt;

        // The only match may be the record being validated
        if (!ctx.recordId.is_null()) {
            auto own = criteria;
            own["id"] = ctx.recordId;
            if (ctx.db->recordExists(ctx.table, own))
                return std::nullopt;
        }

        return std::format("{} must be unique", labelOf(ctx));
    }
} // mdb
