/**
 * @file field_factory.h
 * @brief Creates typed runtime fields from field descriptors.
 */

#ifndef MODELBASE_FIELD_FACTORY_H
#define MODELBASE_FIELD_FACTORY_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "field_base.h"

namespace mdb {
    using FieldCreator = std::function<std::unique_ptr<FieldBase>(const FieldDescriptor &)>;

    /**
     * @brief Registry of field implementations keyed by class name (`TextField`).
     *
     * A descriptor of type `Text` is built by the implementation registered as
     * `TextField`. Registering another creator under an existing class name
     * replaces the built-in implementation.
     */
    class FieldFactory {
    public:
        /// Factory preloaded with one implementation per FieldType.
        FieldFactory();

        void add(const std::string &class_name, FieldCreator creator);

        void remove(const std::string &class_name);

        [[nodiscard]] bool has(const std::string &class_name) const;

        /**
         * @brief Build the runtime field of `descriptor`.
         * @throws SchemaError if no implementation is registered for its type.
         */
        [[nodiscard]] std::unique_ptr<FieldBase> create(const FieldDescriptor &descriptor) const;

        /**
         * @brief Build a field through a specific implementation.
         * @throws SchemaError for unknown class names.
         */
        [[nodiscard]] std::unique_ptr<FieldBase> create(const std::string &class_name,
                                                        const FieldDescriptor &descriptor) const;

        /// Registered class names, sorted.
        [[nodiscard]] std::vector<std::string> classNames() const;

        /// `TextField` -> `Text`.
        static std::string typeFromClassName(const std::string &class_name);

        /// `Text` -> `TextField`.
        static std::string classNameFromType(const std::string &type);

    private:
        std::map<std::string, FieldCreator> m_creators;
    };
} // mdb

#endif //MODELBASE_FIELD_FACTORY_H
