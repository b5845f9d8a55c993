#include "../../include/modelbase/fields/field_factory.h"
#include "../../include/modelbase/fields/fields.h"
#include "../../include/modelbase/core/exceptions.h"
#include "../../include/modelbase/utils/utils.h"

namespace mdb {
    namespace {
        template<typename T>
        FieldCreator creatorOf() {
            return [](const FieldDescriptor &descriptor) { return std::make_unique<T>(descriptor); };
        }
    }

    FieldFactory::FieldFactory() {
        add("IDField", creatorOf<IDField>());
        add("TextField", creatorOf<TextField>());
        add("BigTextField", creatorOf<BigTextField>());
        add("EmailField", creatorOf<EmailField>());
        add("IntegerField", creatorOf<IntegerField>());
        add("FloatField", creatorOf<FloatField>());
        add("BooleanField", creatorOf<BooleanField>());
        add("DateField", creatorOf<DateField>());
        add("DateTimeField", creatorOf<DateTimeField>());
        add("EnumField", creatorOf<EnumField>());
        add("MultiEnumField", creatorOf<MultiEnumField>());
        add("RelatedRecordField", creatorOf<RelatedRecordField>());
        add("ImageField", creatorOf<ImageField>());
        add("VideoField", creatorOf<VideoField>());
        add("PasswordField", creatorOf<PasswordField>());
        add("RadioButtonSetField", creatorOf<RadioButtonSetField>());
    }

    void FieldFactory::add(const std::string &class_name, FieldCreator creator) {
        m_creators[class_name] = std::move(creator);
    }

    void FieldFactory::remove(const std::string &class_name) {
        m_creators.erase(class_name);
    }

    bool FieldFactory::has(const std::string &class_name) const {
        return m_creators.contains(class_name);
    }

    std::unique_ptr<FieldBase> FieldFactory::create(const FieldDescriptor &descriptor) const {
        return create(classNameFromType(descriptor.typeName()), descriptor);
    }

    std::unique_ptr<FieldBase> FieldFactory::create(const std::string &class_name,
                                                    const FieldDescriptor &descriptor) const {
        const auto it = m_creators.find(class_name);
        if (it == m_creators.end())
            throw SchemaError(std::format("No field implementation registered as `{}`", class_name));

        auto field = it->second(descriptor);
        if (!field)
            throw SchemaError(std::format("Field implementation `{}` returned no field", class_name));
        return field;
    }

    std::vector<std::string> FieldFactory::classNames() const {
        std::vector<std::string> out;
        for (const auto &[name, _]: m_creators)
            out.push_back(name);
        return out;
    }

    std::string FieldFactory::typeFromClassName(const std::string &class_name) {
        if (hasSuffix(class_name, "Field"))
            return class_name.substr(0, class_name.size() - std::string("Field").size());
        return class_name;
    }

    std::string FieldFactory::classNameFromType(const std::string &type) {
        return type + "Field";
    }
} // mdb
