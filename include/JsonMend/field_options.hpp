#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

#include "shape.hpp"

namespace JsonMend {

// A concrete type a discriminated union may resolve to. Pointer-style entries
// (std::shared_ptr<T>, std::unique_ptr<T>) name the pointer type itself.
struct UnionEntry {
    const TypeShape* shape = nullptr;

    PointerStyle pointer_style() const {
        return shape ? shape->pointer_style() : PointerStyle::None;
    }
};

template<class T>
UnionEntry union_entry() {
    return UnionEntry{&shape_of<T>()};
}

struct Discriminator {
    std::string propertyName;
    std::map<std::string, UnionEntry, std::less<>> mapping;

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(mapping.size());
        for (const auto& entry : mapping) {
            out.push_back(entry.first);
        }
        return out;
    }
};

using StringList = std::vector<std::string>;
using TypeList = std::vector<const TypeShape*>;

using ConstraintValue = std::variant<bool, std::int64_t, double, std::string, StringList, Discriminator, TypeList>;
using Constraints = std::map<std::string, ConstraintValue, std::less<>>;

namespace constraint_keys {
inline constexpr std::string_view discriminator = "discriminator";
inline constexpr std::string_view anyOf = "anyOf";
inline constexpr std::string_view anyOfTypes = "anyOfTypes";
inline constexpr std::string_view minimum = "minimum";
inline constexpr std::string_view maximum = "maximum";
inline constexpr std::string_view exclusiveMinimum = "exclusiveMinimum";
inline constexpr std::string_view exclusiveMaximum = "exclusiveMaximum";
inline constexpr std::string_view minLength = "minLength";
inline constexpr std::string_view maxLength = "maxLength";
inline constexpr std::string_view pattern = "pattern";
inline constexpr std::string_view enumValues = "enum";
inline constexpr std::string_view minItems = "minItems";
inline constexpr std::string_view maxItems = "maxItems";
inline constexpr std::string_view uniqueItems = "uniqueItems";
inline constexpr std::string_view description = "description";
inline constexpr std::string_view title = "title";
inline constexpr std::string_view format = "format";
inline constexpr std::string_view example = "example";
}

// Checks one value. `accepts` is the type `check` casts its argument to.
struct FieldValidator {
    std::string name;
    std::type_index accepts = std::type_index(typeid(void));
    std::function<std::optional<std::string>(const void*)> check;
};

struct FieldOptions {
    bool required = false;
    std::any defaultValue;
    std::vector<FieldValidator> validators;
    Constraints constraints;

    bool hasDefault() const {
        return defaultValue.has_value();
    }

    template<class C>
    const C* constraint(std::string_view key) const {
        auto it = constraints.find(key);
        if (it == constraints.end()) {
            return nullptr;
        }
        return std::get_if<C>(&it->second);
    }

    const Discriminator* discriminator() const {
        return constraint<Discriminator>(constraint_keys::discriminator);
    }
    const StringList* anyOf() const {
        return constraint<StringList>(constraint_keys::anyOf);
    }
    const TypeList* anyOfTypes() const {
        return constraint<TypeList>(constraint_keys::anyOfTypes);
    }
};

// Resolves the declared options of every member of an object shape.
class FieldScanner {
public:
    virtual ~FieldScanner() = default;
    virtual FieldOptionsMap scan_field_options(const TypeShape& shape) const = 0;
};

class AdapterScanner final : public FieldScanner {
public:
    using Adapter = std::function<FieldOptionsMap(const TypeShape&)>;

    explicit AdapterScanner(Adapter adapter) : m_adapter(std::move(adapter)) {}

    FieldOptionsMap scan_field_options(const TypeShape& shape) const override {
        if (!m_adapter) {
            return {};
        }
        return m_adapter(shape);
    }

private:
    Adapter m_adapter;
};

// Reads JsonMend::FieldMeta<T> specializations.
class DeclaredScanner final : public FieldScanner {
public:
    FieldOptionsMap scan_field_options(const TypeShape& shape) const override {
        if (const FieldOptionsMap* declared = shape.declared_options()) {
            return *declared;
        }
        return {};
    }
};

} // namespace JsonMend
