#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "field_options.hpp"
#include "logging.hpp"

namespace JsonMend {

namespace constraints {

namespace detail {

template<class T> struct unwrap_field { using type = T; };
template<class U> struct unwrap_field<std::optional<U>> : unwrap_field<U> {};
template<class U, class D> struct unwrap_field<std::unique_ptr<U, D>> : unwrap_field<U> {};
template<class U> struct unwrap_field<std::shared_ptr<U>> : unwrap_field<U> {};
template<class U> struct unwrap_field<U*> : unwrap_field<U> {};

template<class A, class B>
constexpr bool less(const A& a, const B& b) {
    if constexpr (std::is_integral_v<A> && std::is_integral_v<B>) {
        return std::cmp_less(a, b);
    } else {
        return static_cast<double>(a) < static_cast<double>(b);
    }
}

template<class N>
ConstraintValue number_constraint(N n) {
    if constexpr (std::is_integral_v<N>) {
        return ConstraintValue(std::in_range<std::int64_t>(n) ? static_cast<std::int64_t>(n) : INT64_MAX);
    } else {
        return ConstraintValue(static_cast<double>(n));
    }
}

inline std::size_t utf8_length(std::string_view s) {
    std::size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            n ++;
        }
    }
    return n;
}

} // namespace detail

// Options under construction for a member of type T. Validators see the
// value behind optionals and pointers.
template<class T>
struct FieldSpec {
    using field_type = T;
    using value_type = typename detail::unwrap_field<T>::type;

    FieldOptions options;

    template<class Fn>
    void add_validator(std::string name, Fn fn) {
        options.validators.push_back(FieldValidator{
            std::move(name),
            std::type_index(typeid(value_type)),
            [fn = std::move(fn)](const void* p) -> std::optional<std::string> {
                return fn(*static_cast<const value_type*>(p));
            }});
    }
};

template<class T, class... Mods>
std::shared_ptr<const FieldOptions> field(Mods&&... mods) {
    FieldSpec<T> spec;
    (mods.apply(spec), ...);
    return std::make_shared<const FieldOptions>(std::move(spec.options));
}

struct required {
    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.options.required = true;
    }
    static constexpr std::string_view to_string() {
        return "required";
    }
};

template<class V>
struct default_value {
    V value;
    explicit default_value(V v) : value(std::move(v)) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_constructible_v<Value, const V&>, "[[[ JsonMend ]]] default_value: value is not convertible to the field type");
        spec.options.defaultValue = std::any(Value(value));
    }
    static constexpr std::string_view to_string() {
        return "default_value";
    }
};
template<class V>
default_value(V) -> default_value<V>;

// Custom check: returns an error message, or nullopt when the value is fine.
template<class Fn>
struct validate {
    Fn fn;
    explicit validate(Fn f) : fn(std::move(f)) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.add_validator("custom", fn);
    }
    static constexpr std::string_view to_string() {
        return "validate";
    }
};
template<class Fn>
validate(Fn) -> validate<Fn>;

template<class N>
struct minimum {
    N bound;
    explicit minimum(N n) : bound(n) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_arithmetic_v<Value>, "[[[ JsonMend ]]] minimum: Option is not applicable to field");
        spec.add_validator("minimum", [b = bound](const Value& v) -> std::optional<std::string> {
            if (detail::less(v, b)) {
                return fmt::format("value must be >= {}", b);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::minimum)] = detail::number_constraint(bound);
    }
    static constexpr std::string_view to_string() {
        return "minimum";
    }
};

template<class N>
struct maximum {
    N bound;
    explicit maximum(N n) : bound(n) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_arithmetic_v<Value>, "[[[ JsonMend ]]] maximum: Option is not applicable to field");
        spec.add_validator("maximum", [b = bound](const Value& v) -> std::optional<std::string> {
            if (detail::less(b, v)) {
                return fmt::format("value must be <= {}", b);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::maximum)] = detail::number_constraint(bound);
    }
    static constexpr std::string_view to_string() {
        return "maximum";
    }
};

template<class N>
struct exclusive_minimum {
    N bound;
    explicit exclusive_minimum(N n) : bound(n) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_arithmetic_v<Value>, "[[[ JsonMend ]]] exclusive_minimum: Option is not applicable to field");
        spec.add_validator("exclusiveMinimum", [b = bound](const Value& v) -> std::optional<std::string> {
            if (!detail::less(b, v)) {
                return fmt::format("value must be > {}", b);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::exclusiveMinimum)] = detail::number_constraint(bound);
    }
    static constexpr std::string_view to_string() {
        return "exclusive_minimum";
    }
};

template<class N>
struct exclusive_maximum {
    N bound;
    explicit exclusive_maximum(N n) : bound(n) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_arithmetic_v<Value>, "[[[ JsonMend ]]] exclusive_maximum: Option is not applicable to field");
        spec.add_validator("exclusiveMaximum", [b = bound](const Value& v) -> std::optional<std::string> {
            if (!detail::less(v, b)) {
                return fmt::format("value must be < {}", b);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::exclusiveMaximum)] = detail::number_constraint(bound);
    }
    static constexpr std::string_view to_string() {
        return "exclusive_maximum";
    }
};

// Lengths count UTF-8 code points.
struct min_length {
    std::size_t n;
    explicit min_length(std::size_t len) : n(len) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_same_v<Value, std::string>, "[[[ JsonMend ]]] min_length: Option is not applicable to field");
        spec.add_validator("minLength", [n = n](const std::string& v) -> std::optional<std::string> {
            if (detail::utf8_length(v) < n) {
                return fmt::format("length must be >= {}", n);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::minLength)] = detail::number_constraint(n);
    }
    static constexpr std::string_view to_string() {
        return "min_length";
    }
};

struct max_length {
    std::size_t n;
    explicit max_length(std::size_t len) : n(len) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_same_v<Value, std::string>, "[[[ JsonMend ]]] max_length: Option is not applicable to field");
        spec.add_validator("maxLength", [n = n](const std::string& v) -> std::optional<std::string> {
            if (detail::utf8_length(v) > n) {
                return fmt::format("length must be <= {}", n);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::maxLength)] = detail::number_constraint(n);
    }
    static constexpr std::string_view to_string() {
        return "max_length";
    }
};

// ECMAScript syntax, matched anywhere in the value.
struct pattern {
    std::string expression;
    explicit pattern(std::string re) : expression(std::move(re)) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_same_v<Value, std::string>, "[[[ JsonMend ]]] pattern: Option is not applicable to field");
        std::shared_ptr<const std::regex> compiled = compile(expression);
        spec.add_validator("pattern", [compiled, expr = expression](const std::string& v) -> std::optional<std::string> {
            if (!compiled) {
                return fmt::format("invalid pattern {}", expr);
            }
            if (!std::regex_search(v, *compiled)) {
                return fmt::format("value does not match pattern {}", expr);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::pattern)] = ConstraintValue(expression);
    }
    static constexpr std::string_view to_string() {
        return "pattern";
    }

private:
    static std::shared_ptr<const std::regex> compile(const std::string& expression) {
        try {
            return std::make_shared<const std::regex>(expression, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            JSONMEND_LOG_WARN("pattern '{}' does not compile: {}", expression, e.what());
            return nullptr;
        }
    }
};

struct one_of {
    StringList values;
    one_of(std::initializer_list<std::string> v) : values(v) {}
    explicit one_of(StringList v) : values(std::move(v)) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        static_assert(std::is_same_v<Value, std::string>, "[[[ JsonMend ]]] one_of: Option is not applicable to field");
        spec.add_validator("enum", [values = values](const std::string& v) -> std::optional<std::string> {
            for (const std::string& allowed : values) {
                if (allowed == v) {
                    return std::nullopt;
                }
            }
            return fmt::format("value must be one of [{}]", fmt::join(values, " "));
        });
        spec.options.constraints[std::string(constraint_keys::enumValues)] = ConstraintValue(values);
    }
    static constexpr std::string_view to_string() {
        return "one_of";
    }
};

struct min_items {
    std::size_t n;
    explicit min_items(std::size_t count) : n(count) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        spec.add_validator("minItems", [n = n](const Value& v) -> std::optional<std::string> {
            if (v.size() < n) {
                return fmt::format("must have at least {} items", n);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::minItems)] = detail::number_constraint(n);
    }
    static constexpr std::string_view to_string() {
        return "min_items";
    }
};

struct max_items {
    std::size_t n;
    explicit max_items(std::size_t count) : n(count) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        spec.add_validator("maxItems", [n = n](const Value& v) -> std::optional<std::string> {
            if (v.size() > n) {
                return fmt::format("must have at most {} items", n);
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::maxItems)] = detail::number_constraint(n);
    }
    static constexpr std::string_view to_string() {
        return "max_items";
    }
};

struct unique_items {
    template<class T>
    void apply(FieldSpec<T>& spec) const {
        using Value = typename FieldSpec<T>::value_type;
        using Element = typename Value::value_type;
        static_assert(std::equality_comparable<Element>, "[[[ JsonMend ]]] unique_items: elements must be equality comparable");
        spec.add_validator("uniqueItems", [](const Value& v) -> std::optional<std::string> {
            for (std::size_t i = 0; i < v.size(); i ++) {
                for (std::size_t j = 0; j < i; j ++) {
                    if (v[i] == v[j]) {
                        if constexpr (fmt::is_formattable<Element>::value) {
                            return fmt::format("duplicate item found: {}", v[i]);
                        } else {
                            return fmt::format("duplicate item found: [{}]", i);
                        }
                    }
                }
            }
            return std::nullopt;
        });
        spec.options.constraints[std::string(constraint_keys::uniqueItems)] = ConstraintValue(true);
    }
    static constexpr std::string_view to_string() {
        return "unique_items";
    }
};

struct description {
    std::string text;
    explicit description(std::string s) : text(std::move(s)) {}
    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.options.constraints[std::string(constraint_keys::description)] = ConstraintValue(text);
    }
    static constexpr std::string_view to_string() {
        return "description";
    }
};

struct title {
    std::string text;
    explicit title(std::string s) : text(std::move(s)) {}
    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.options.constraints[std::string(constraint_keys::title)] = ConstraintValue(text);
    }
    static constexpr std::string_view to_string() {
        return "title";
    }
};

struct format {
    std::string text;
    explicit format(std::string s) : text(std::move(s)) {}
    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.options.constraints[std::string(constraint_keys::format)] = ConstraintValue(text);
    }
    static constexpr std::string_view to_string() {
        return "format";
    }
};

struct discriminator {
    Discriminator value;
    discriminator(std::string propertyName, std::initializer_list<std::pair<const std::string, UnionEntry>> entries) {
        value.propertyName = std::move(propertyName);
        value.mapping.insert(entries.begin(), entries.end());
    }

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.options.constraints[std::string(constraint_keys::discriminator)] = ConstraintValue(value);
    }
    static constexpr std::string_view to_string() {
        return "discriminator";
    }
};

// Allowed JSON type names: string, integer, number, boolean, object, array, null.
struct any_of {
    StringList types;
    any_of(std::initializer_list<std::string> t) : types(t) {}

    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.options.constraints[std::string(constraint_keys::anyOf)] = ConstraintValue(types);
    }
    static constexpr std::string_view to_string() {
        return "any_of";
    }
};

template<class... Ts>
struct any_of_types {
    template<class T>
    void apply(FieldSpec<T>& spec) const {
        spec.options.constraints[std::string(constraint_keys::anyOfTypes)] = ConstraintValue(TypeList{&shape_of<Ts>()...});
    }
    static constexpr std::string_view to_string() {
        return "any_of_types";
    }
};

} // namespace constraints

} // namespace JsonMend
