/**
 * @file fields.h
 * @brief The built-in field types.
 */

#ifndef MODELBASE_FIELDS_H
#define MODELBASE_FIELDS_H

#include "field_base.h"

namespace mdb {
    class IDField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "HiddenInput"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::optional<std::string> checkType(const nlohmann::ordered_json &value) const override;
    };

    /**
     * @brief Single line text. Honours the `maxLength` schema key.
     */
    class TextField : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::optional<std::string> checkType(const nlohmann::ordered_json &value) const override;
    };

    class BigTextField final : public TextField {
    public:
        using TextField::TextField;

        [[nodiscard]] std::string reactComponent() const override { return "TextArea"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;
    };

    class EmailField final : public TextField {
    public:
        using TextField::TextField;

        [[nodiscard]] std::string reactComponent() const override { return "EmailInput"; }

    protected:
        [[nodiscard]] std::vector<std::string> impliedRules() const override { return {"Email"}; }
    };

    /**
     * @brief Whole numbers. Numeric strings are accepted and converted;
     * `minValue`/`maxValue` schema keys bound the value.
     */
    class IntegerField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "NumberInput"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::optional<std::string> checkType(const nlohmann::ordered_json &value) const override;

        [[nodiscard]] nlohmann::ordered_json normalize(const nlohmann::ordered_json &value) const override;
    };

    class FloatField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "NumberInput"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::optional<std::string> checkType(const nlohmann::ordered_json &value) const override;

        [[nodiscard]] nlohmann::ordered_json normalize(const nlohmann::ordered_json &value) const override;
    };

    class BooleanField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "Checkbox"; }

    protected:
        [[nodiscard]] std::optional<std::string> checkType(const nlohmann::ordered_json &value) const override;

        [[nodiscard]] nlohmann::ordered_json normalize(const nlohmann::ordered_json &value) const override;
    };

    class DateField : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "DatePicker"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::vector<std::string> impliedRules() const override { return {"DateTime"}; }
    };

    class DateTimeField final : public DateField {
    public:
        using DateField::DateField;

        [[nodiscard]] std::string reactComponent() const override { return "DateTimePicker"; }
    };

    /**
     * @brief Single choice among static or provider-supplied options.
     */
    class EnumField : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "Select"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::vector<std::string> impliedRules() const override { return {"Options"}; }
    };

    class RadioButtonSetField final : public EnumField {
    public:
        using EnumField::EnumField;

        [[nodiscard]] std::string reactComponent() const override { return "RadioButtonSet"; }
    };

    /**
     * @brief Several choices; the value is an array of option keys.
     */
    class MultiEnumField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "MultiSelect"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::optional<std::string> checkType(const nlohmann::ordered_json &value) const override;

        [[nodiscard]] std::vector<std::string> impliedRules() const override { return {"Options"}; }
    };

    class RelatedRecordField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "RelatedRecordSelect"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;

    protected:
        [[nodiscard]] std::optional<std::string> checkType(const nlohmann::ordered_json &value) const override;
    };

    class ImageField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "ImageUpload"; }
    };

    class VideoField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "VideoEmbed"; }

    protected:
        [[nodiscard]] std::vector<std::string> impliedRules() const override { return {"VideoURL"}; }
    };

    /// Password values can't be filtered on beyond presence.
    class PasswordField final : public FieldBase {
    public:
        using FieldBase::FieldBase;

        [[nodiscard]] std::string reactComponent() const override { return "PasswordInput"; }

        [[nodiscard]] std::vector<std::string> defaultOperators() const override;
    };
} // mdb

#endif //MODELBASE_FIELDS_H
