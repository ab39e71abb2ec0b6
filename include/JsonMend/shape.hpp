#pragma once

#include <any>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "options.hpp"
#include "struct_introspection.hpp"
#include "logging.hpp"

namespace JsonMend {

struct FieldOptions;

// Per-member options keyed by C++ member name.
using FieldOptionsMap = std::map<std::string, std::shared_ptr<const FieldOptions>, std::less<>>;

// Specialize with `static FieldOptionsMap options();` to declare options for the members of T.
template<class T>
struct FieldMeta {};

enum class ShapeKind {
    Bool,
    Integer,
    Number,
    String,
    Array,
    Map,
    Object,
    Reference,
    Variant,
    Any,
    Leaf
};

constexpr std::string_view shape_kind_to_string(ShapeKind k) {
    switch (k) {
    case ShapeKind::Bool: return "bool"; break;
    case ShapeKind::Integer: return "integer"; break;
    case ShapeKind::Number: return "number"; break;
    case ShapeKind::String: return "string"; break;
    case ShapeKind::Array: return "array"; break;
    case ShapeKind::Map: return "map"; break;
    case ShapeKind::Object: return "object"; break;
    case ShapeKind::Reference: return "reference"; break;
    case ShapeKind::Variant: return "variant"; break;
    case ShapeKind::Any: return "any"; break;
    case ShapeKind::Leaf: return "leaf"; break;
    }
    return "N/A";
}

enum class PointerStyle {
    None,
    Optional,
    Unique,
    Shared,
    Raw
};

class TypeShape;
using ShapeGetter = const TypeShape& (*)();

struct FieldShape {
    std::string_view name;
    std::string_view jsonName;
    ShapeGetter shape;
    void* (*access)(void* object);
};

// Runtime description of a C++ type: what JSON kind it maps to and how to reach into it.
// One instance per type, obtained through shape_of<T>().
class TypeShape {
public:
    TypeShape(ShapeKind kind, std::type_index type, std::string name)
        : m_kind(kind), m_type(type), m_name(std::move(name)) {}
    TypeShape(const TypeShape&) = delete;
    TypeShape& operator=(const TypeShape&) = delete;
    virtual ~TypeShape() = default;

    ShapeKind kind() const { return m_kind; }
    std::type_index type() const { return m_type; }
    const std::string& name() const { return m_name; }

    virtual bool is_zero(const void* p) const = 0;
    // Copies a value held in `v` into *p. Accepts T itself, or the payload of an optional, pointer or variant alternative.
    virtual bool assign_any(void* p, const std::any& v) const = 0;
    virtual std::shared_ptr<void> create() const = 0;
    virtual bool move_assign(void* dst, void* src) const = 0;
    // Puts the value into the null state: empty container, null pointer, monostate, empty any.
    virtual bool reset(void* p) const = 0;
    // Pointer to the payload when `a` holds exactly this type.
    virtual void* any_payload(std::any& a) const = 0;
    virtual void* emplace_into_any(std::any& a) const = 0;

    virtual bool read_bool(const void*) const { return false; }
    virtual void write_bool(void*, bool) const {}
    virtual bool is_unsigned() const { return false; }
    virtual std::int64_t read_int(const void*) const { return 0; }
    virtual std::uint64_t read_uint(const void*) const { return 0; }
    virtual bool write_int(void*, std::int64_t) const { return false; }
    virtual bool write_uint(void*, std::uint64_t) const { return false; }
    virtual double read_real(const void*) const { return 0; }
    virtual void write_real(void*, double) const {}
    virtual std::string_view read_string(const void*) const { return {}; }
    virtual void write_string(void*, std::string_view) const {}

    // Array and Map
    virtual const TypeShape* element() const { return nullptr; }
    virtual std::size_t size(const void*) const { return 0; }
    virtual void* element_at(void*, std::size_t) const { return nullptr; }
    virtual const void* element_at(const void*, std::size_t) const { return nullptr; }
    virtual void* append(void*) const { return nullptr; }
    virtual void pop_back(void*) const {}
    virtual void* map_emplace(void*, std::string_view) const { return nullptr; }
    virtual void visit_entries(const void*, const std::function<bool(std::string_view, const void*)>&) const {}

    // Object
    virtual const std::vector<FieldShape>& fields() const {
        static const std::vector<FieldShape> none;
        return none;
    }
    virtual const FieldOptionsMap* declared_options() const { return nullptr; }

    // Reference
    virtual PointerStyle pointer_style() const { return PointerStyle::None; }
    virtual const TypeShape* target() const { return nullptr; }
    virtual void* deref(void*) const { return nullptr; }
    virtual const void* deref(const void*) const { return nullptr; }
    // Allocates the target if it is absent; raw pointers cannot be allocated.
    virtual void* ensure(void*) const { return nullptr; }

    // Variant and Any
    virtual std::vector<const TypeShape*> alternatives() const { return {}; }
    virtual const TypeShape* active_shape(const void*) const { return nullptr; }
    virtual void* active_value(void*) const { return nullptr; }
    virtual const void* active_value(const void*) const { return nullptr; }
    // Switches to alternative `alt`, default constructed. Null when `alt` is not an alternative.
    virtual void* emplace(void*, const TypeShape& alt) const { return nullptr; }

private:
    ShapeKind m_kind;
    std::type_index m_type;
    std::string m_name;
};

class ShapeRegistry {
public:
    static ShapeRegistry& instance() {
        static ShapeRegistry r;
        return r;
    }

    void add(const TypeShape& shape) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shapes.emplace(shape.type(), &shape);
    }

    const TypeShape* find(std::type_index type) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_shapes.find(type);
        return it == m_shapes.end() ? nullptr : it->second;
    }

private:
    ShapeRegistry() = default;

    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, const TypeShape*> m_shapes;
};

template<class T>
const TypeShape& shape_of();

inline const TypeShape* find_shape(std::type_index type);

namespace detail {

template<class T> struct is_vector : std::false_type {};
template<class U, class A> struct is_vector<std::vector<U, A>> : std::true_type {};

template<class T> struct is_string_map : std::false_type {};
template<class V, class C, class A> struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};
template<class V, class H, class E, class A> struct is_string_map<std::unordered_map<std::string, V, H, E, A>> : std::true_type {};

template<class T> struct is_variant : std::false_type {};
template<class... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template<class T> struct variant_has_monostate : std::false_type {};
template<class... Ts> struct variant_has_monostate<std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<Ts, std::monostate> || ...)> {};

template<class T> struct is_std_array : std::false_type {};
template<class U, std::size_t N> struct is_std_array<std::array<U, N>> : std::true_type {};

template<class T>
struct reference_traits {
    static constexpr bool value = false;
    static constexpr PointerStyle style = PointerStyle::None;
};
template<class U>
struct reference_traits<std::optional<U>> {
    static constexpr bool value = true;
    static constexpr PointerStyle style = PointerStyle::Optional;
    using target = U;
};
template<class U, class D>
struct reference_traits<std::unique_ptr<U, D>> {
    static constexpr bool value = true;
    static constexpr PointerStyle style = PointerStyle::Unique;
    using target = U;
};
template<class U>
struct reference_traits<std::shared_ptr<U>> {
    static constexpr bool value = true;
    static constexpr PointerStyle style = PointerStyle::Shared;
    using target = U;
};
template<class U>
struct reference_traits<U*> {
    static constexpr bool value = true;
    static constexpr PointerStyle style = PointerStyle::Raw;
    using target = U;
};

template<class T>
inline constexpr bool is_char_v = std::is_same_v<T, char> || std::is_same_v<T, wchar_t>
                                  || std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t>
                                  || std::is_same_v<T, char32_t>;

template<class T>
constexpr ShapeKind classify() {
    static_assert(!std::is_same_v<T, std::vector<bool>>, "[[[ JsonMend ]]] std::vector<bool> is not supported, use std::vector<char> or a struct");
    static_assert(!is_annotated_v<T>, "[[[ JsonMend ]]] Annotated<> is only meaningful as a struct member");
    if constexpr (std::is_same_v<T, bool>) {
        return ShapeKind::Bool;
    } else if constexpr (std::is_integral_v<T> && !is_char_v<T>) {
        return ShapeKind::Integer;
    } else if constexpr (std::is_floating_point_v<T>) {
        return ShapeKind::Number;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return ShapeKind::String;
    } else if constexpr (is_vector<T>::value) {
        return ShapeKind::Array;
    } else if constexpr (is_string_map<T>::value) {
        return ShapeKind::Map;
    } else if constexpr (reference_traits<T>::value) {
        return ShapeKind::Reference;
    } else if constexpr (is_variant<T>::value) {
        return ShapeKind::Variant;
    } else if constexpr (std::is_same_v<T, std::any>) {
        return ShapeKind::Any;
    } else if constexpr (std::is_class_v<T> && std::is_aggregate_v<T>
                         && !is_std_array<T>::value && !std::is_same_v<T, std::monostate>) {
        return ShapeKind::Object;
    } else {
        return ShapeKind::Leaf;
    }
}

template<class T>
struct TypeNameOf {
    static constexpr std::string_view raw() {
        return __PRETTY_FUNCTION__;
    }
};

template<class T>
std::string pretty_name() {
    std::string_view s = TypeNameOf<T>::raw();
    const std::size_t from = s.find("T = ");
    if (from == std::string_view::npos) {
        return std::string(s);
    }
    s.remove_prefix(from + 4);
    std::size_t to = s.find(';');
    if (to == std::string_view::npos) {
        to = s.rfind(']');
    }
    return std::string(s.substr(0, to));
}

template<class T>
struct type_name_of {
    static std::string get() { return pretty_name<T>(); }
};
template<>
struct type_name_of<std::string> {
    static std::string get() { return "std::string"; }
};
template<class U, class A>
struct type_name_of<std::vector<U, A>> {
    static std::string get() { return "std::vector<" + type_name_of<U>::get() + ">"; }
};
template<class V, class C, class A>
struct type_name_of<std::map<std::string, V, C, A>> {
    static std::string get() { return "std::map<std::string, " + type_name_of<V>::get() + ">"; }
};
template<class V, class H, class E, class A>
struct type_name_of<std::unordered_map<std::string, V, H, E, A>> {
    static std::string get() { return "std::unordered_map<std::string, " + type_name_of<V>::get() + ">"; }
};
template<class U>
struct type_name_of<std::optional<U>> {
    static std::string get() { return "std::optional<" + type_name_of<U>::get() + ">"; }
};
template<class U, class D>
struct type_name_of<std::unique_ptr<U, D>> {
    static std::string get() { return "std::unique_ptr<" + type_name_of<U>::get() + ">"; }
};
template<class U>
struct type_name_of<std::shared_ptr<U>> {
    static std::string get() { return "std::shared_ptr<" + type_name_of<U>::get() + ">"; }
};
template<class U>
struct type_name_of<U*> {
    static std::string get() { return type_name_of<U>::get() + "*"; }
};
template<class... Ts>
struct type_name_of<std::variant<Ts...>> {
    static std::string get() {
        std::string out = "std::variant<";
        bool first = true;
        ((out += (first ? "" : ", ") + type_name_of<Ts>::get(), first = false), ...);
        return out + ">";
    }
};
template<>
struct type_name_of<std::any> {
    static std::string get() { return "std::any"; }
};
template<>
struct type_name_of<std::monostate> {
    static std::string get() { return "std::monostate"; }
};

template<class T>
concept HasFieldMeta = requires {
    { FieldMeta<T>::options() } -> std::convertible_to<FieldOptionsMap>;
};

template<class T>
class ShapeImpl final : public TypeShape {
    static constexpr ShapeKind Kind = classify<T>();

public:
    ShapeImpl() : TypeShape(Kind, std::type_index(typeid(T)), type_name_of<T>::get()) {
        if constexpr (Kind == ShapeKind::Object) {
            add_fields(std::make_index_sequence<introspection::Members<T>::count>{});
        }
    }

    bool is_zero(const void* p) const override {
        const T& v = *static_cast<const T*>(p);
        if constexpr (Kind == ShapeKind::Bool) {
            return !v;
        } else if constexpr (Kind == ShapeKind::Integer || Kind == ShapeKind::Number) {
            return v == T{};
        } else if constexpr (Kind == ShapeKind::String || Kind == ShapeKind::Array || Kind == ShapeKind::Map) {
            return v.empty();
        } else if constexpr (Kind == ShapeKind::Reference) {
            if constexpr (reference_traits<T>::style == PointerStyle::Optional) {
                return !v.has_value();
            } else {
                return v == nullptr;
            }
        } else if constexpr (Kind == ShapeKind::Variant) {
            if constexpr (variant_has_monostate<T>::value) {
                return std::holds_alternative<std::monostate>(v);
            } else {
                return false;
            }
        } else if constexpr (Kind == ShapeKind::Any) {
            return !v.has_value();
        } else if constexpr (Kind == ShapeKind::Object) {
            for (const FieldShape& f : m_fields) {
                if (!f.shape().is_zero(f.access(const_cast<T*>(&v)))) {
                    return false;
                }
            }
            return true;
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::equality_comparable<T> && std::is_default_constructible_v<T>) {
            return v == T{};
        } else {
            return false;
        }
    }

    bool assign_any(void* p, const std::any& a) const override {
        if (!a.has_value()) {
            return false;
        }
        T& v = *static_cast<T*>(p);
        if constexpr (std::is_same_v<T, std::any>) {
            v = a;
            return true;
        } else {
            if constexpr (std::is_copy_assignable_v<T>) {
                if (const T* exact = std::any_cast<T>(&a)) {
                    v = *exact;
                    return true;
                }
            }
            if constexpr (Kind == ShapeKind::Reference) {
                using U = typename reference_traits<T>::target;
                if constexpr (std::is_copy_constructible_v<U>) {
                    if (const U* inner = std::any_cast<U>(&a)) {
                        constexpr PointerStyle style = reference_traits<T>::style;
                        if constexpr (style == PointerStyle::Optional) {
                            v.emplace(*inner);
                            return true;
                        } else if constexpr (style == PointerStyle::Unique) {
                            v = std::make_unique<U>(*inner);
                            return true;
                        } else if constexpr (style == PointerStyle::Shared) {
                            v = std::make_shared<U>(*inner);
                            return true;
                        }
                    }
                }
            }
            if constexpr (Kind == ShapeKind::Variant) {
                return assign_alternative(v, a, std::make_index_sequence<std::variant_size_v<T>>{});
            }
            return false;
        }
    }

    std::shared_ptr<void> create() const override {
        if constexpr (std::is_default_constructible_v<T>) {
            return std::make_shared<T>();
        } else {
            return nullptr;
        }
    }

    bool move_assign(void* dst, void* src) const override {
        if constexpr (std::is_move_assignable_v<T>) {
            *static_cast<T*>(dst) = std::move(*static_cast<T*>(src));
            return true;
        } else {
            return false;
        }
    }

    bool reset(void* p) const override {
        T& v = *static_cast<T*>(p);
        if constexpr (Kind == ShapeKind::Array || Kind == ShapeKind::Map) {
            v.clear();
            return true;
        } else if constexpr (Kind == ShapeKind::Reference) {
            if constexpr (reference_traits<T>::style == PointerStyle::Optional) {
                v.reset();
            } else {
                v = nullptr;
            }
            return true;
        } else if constexpr (Kind == ShapeKind::Variant) {
            if constexpr (variant_has_monostate<T>::value) {
                v = std::monostate{};
                return true;
            } else {
                return false;
            }
        } else if constexpr (Kind == ShapeKind::Any) {
            v.reset();
            return true;
        } else {
            return false;
        }
    }

    void* any_payload(std::any& a) const override {
        if constexpr (std::is_copy_constructible_v<T>) {
            return std::any_cast<T>(&a);
        } else {
            return nullptr;
        }
    }

    void* emplace_into_any(std::any& a) const override {
        if constexpr (std::is_copy_constructible_v<T> && std::is_default_constructible_v<T>) {
            return &a.emplace<T>();
        } else {
            return nullptr;
        }
    }

    bool read_bool(const void* p) const override {
        if constexpr (Kind == ShapeKind::Bool) {
            return *static_cast<const T*>(p);
        } else {
            return false;
        }
    }
    void write_bool(void* p, bool b) const override {
        if constexpr (Kind == ShapeKind::Bool) {
            *static_cast<T*>(p) = b;
        }
    }

    bool is_unsigned() const override {
        return Kind == ShapeKind::Integer && std::is_unsigned_v<T>;
    }
    std::int64_t read_int(const void* p) const override {
        if constexpr (Kind == ShapeKind::Integer) {
            return static_cast<std::int64_t>(*static_cast<const T*>(p));
        } else {
            return 0;
        }
    }
    std::uint64_t read_uint(const void* p) const override {
        if constexpr (Kind == ShapeKind::Integer) {
            return static_cast<std::uint64_t>(*static_cast<const T*>(p));
        } else {
            return 0;
        }
    }
    bool write_int(void* p, std::int64_t i) const override {
        if constexpr (Kind == ShapeKind::Integer) {
            if (!std::in_range<T>(i)) {
                return false;
            }
            *static_cast<T*>(p) = static_cast<T>(i);
            return true;
        } else {
            return false;
        }
    }
    bool write_uint(void* p, std::uint64_t u) const override {
        if constexpr (Kind == ShapeKind::Integer) {
            if (!std::in_range<T>(u)) {
                return false;
            }
            *static_cast<T*>(p) = static_cast<T>(u);
            return true;
        } else {
            return false;
        }
    }
    double read_real(const void* p) const override {
        if constexpr (Kind == ShapeKind::Number || Kind == ShapeKind::Integer) {
            return static_cast<double>(*static_cast<const T*>(p));
        } else {
            return 0;
        }
    }
    void write_real(void* p, double d) const override {
        if constexpr (Kind == ShapeKind::Number) {
            *static_cast<T*>(p) = static_cast<T>(d);
        }
    }
    std::string_view read_string(const void* p) const override {
        if constexpr (Kind == ShapeKind::String) {
            return *static_cast<const T*>(p);
        } else {
            return {};
        }
    }
    void write_string(void* p, std::string_view s) const override {
        if constexpr (Kind == ShapeKind::String) {
            static_cast<T*>(p)->assign(s);
        }
    }

    const TypeShape* element() const override {
        if constexpr (Kind == ShapeKind::Array) {
            return &shape_of<typename T::value_type>();
        } else if constexpr (Kind == ShapeKind::Map) {
            return &shape_of<typename T::mapped_type>();
        } else {
            return nullptr;
        }
    }

    std::size_t size(const void* p) const override {
        if constexpr (Kind == ShapeKind::Array || Kind == ShapeKind::Map) {
            return static_cast<const T*>(p)->size();
        } else {
            return 0;
        }
    }
    void* element_at(void* p, std::size_t i) const override {
        if constexpr (Kind == ShapeKind::Array) {
            return &(*static_cast<T*>(p))[i];
        } else {
            return nullptr;
        }
    }
    const void* element_at(const void* p, std::size_t i) const override {
        if constexpr (Kind == ShapeKind::Array) {
            return &(*static_cast<const T*>(p))[i];
        } else {
            return nullptr;
        }
    }
    void* append(void* p) const override {
        if constexpr (Kind == ShapeKind::Array) {
            if constexpr (std::is_default_constructible_v<typename T::value_type>) {
                return &static_cast<T*>(p)->emplace_back();
            } else {
                return nullptr;
            }
        } else {
            return nullptr;
        }
    }
    void pop_back(void* p) const override {
        if constexpr (Kind == ShapeKind::Array) {
            static_cast<T*>(p)->pop_back();
        }
    }
    void* map_emplace(void* p, std::string_view key) const override {
        if constexpr (Kind == ShapeKind::Map) {
            if constexpr (std::is_default_constructible_v<typename T::mapped_type>) {
                return &(*static_cast<T*>(p))[std::string(key)];
            } else {
                return nullptr;
            }
        } else {
            return nullptr;
        }
    }
    void visit_entries(const void* p, const std::function<bool(std::string_view, const void*)>& visit) const override {
        if constexpr (Kind == ShapeKind::Map) {
            for (const auto& [k, v] : *static_cast<const T*>(p)) {
                if (!visit(k, &v)) {
                    return;
                }
            }
        }
    }

    const std::vector<FieldShape>& fields() const override {
        return m_fields;
    }

    const FieldOptionsMap* declared_options() const override {
        if constexpr (Kind == ShapeKind::Object && HasFieldMeta<T>) {
            static const FieldOptionsMap declared = [this] {
                FieldOptionsMap m = FieldMeta<T>::options();
                for (const auto& entry : m) {
                    bool known = false;
                    for (const FieldShape& f : m_fields) {
                        known = known || f.name == entry.first;
                    }
                    if (!known) {
                        JSONMEND_LOG_WARN("options declared for unknown member '{}' of {}", entry.first, name());
                    }
                }
                return m;
            }();
            return &declared;
        } else {
            return nullptr;
        }
    }

    PointerStyle pointer_style() const override {
        return reference_traits<T>::style;
    }
    const TypeShape* target() const override {
        if constexpr (Kind == ShapeKind::Reference) {
            return &shape_of<typename reference_traits<T>::target>();
        } else {
            return nullptr;
        }
    }
    void* deref(void* p) const override {
        if constexpr (Kind == ShapeKind::Reference) {
            T& v = *static_cast<T*>(p);
            if constexpr (reference_traits<T>::style == PointerStyle::Optional) {
                return v.has_value() ? &*v : nullptr;
            } else if constexpr (reference_traits<T>::style == PointerStyle::Raw) {
                return const_cast<std::remove_const_t<typename reference_traits<T>::target>*>(v);
            } else {
                return v.get();
            }
        } else {
            return nullptr;
        }
    }
    const void* deref(const void* p) const override {
        return deref(const_cast<void*>(p));
    }
    void* ensure(void* p) const override {
        if constexpr (Kind == ShapeKind::Reference) {
            using U = typename reference_traits<T>::target;
            T& v = *static_cast<T*>(p);
            constexpr PointerStyle style = reference_traits<T>::style;
            if (void* existing = deref(p)) {
                return existing;
            }
            if constexpr (!std::is_default_constructible_v<U> || style == PointerStyle::Raw) {
                return nullptr;
            } else if constexpr (style == PointerStyle::Optional) {
                return &v.emplace();
            } else if constexpr (style == PointerStyle::Unique) {
                v = std::make_unique<U>();
                return v.get();
            } else {
                v = std::make_shared<U>();
                return v.get();
            }
        } else {
            return nullptr;
        }
    }

    std::vector<const TypeShape*> alternatives() const override {
        if constexpr (Kind == ShapeKind::Variant) {
            return collect_alternatives(std::make_index_sequence<std::variant_size_v<T>>{});
        } else {
            return {};
        }
    }
    const TypeShape* active_shape(const void* p) const override {
        if constexpr (Kind == ShapeKind::Variant) {
            return std::visit([](const auto& alt) -> const TypeShape* {
                using A = std::remove_cvref_t<decltype(alt)>;
                if constexpr (std::is_same_v<A, std::monostate>) {
                    return nullptr;
                } else {
                    return &shape_of<A>();
                }
            }, *static_cast<const T*>(p));
        } else if constexpr (Kind == ShapeKind::Any) {
            const std::any& a = *static_cast<const std::any*>(p);
            if (!a.has_value()) {
                return nullptr;
            }
            return find_shape(std::type_index(a.type()));
        } else {
            return nullptr;
        }
    }
    void* active_value(void* p) const override {
        if constexpr (Kind == ShapeKind::Variant) {
            return std::visit([](auto& alt) -> void* {
                using A = std::remove_cvref_t<decltype(alt)>;
                if constexpr (std::is_same_v<A, std::monostate>) {
                    return nullptr;
                } else {
                    return &alt;
                }
            }, *static_cast<T*>(p));
        } else if constexpr (Kind == ShapeKind::Any) {
            std::any& a = *static_cast<std::any*>(p);
            const TypeShape* held = active_shape(p);
            return held ? held->any_payload(a) : nullptr;
        } else {
            return nullptr;
        }
    }
    const void* active_value(const void* p) const override {
        return active_value(const_cast<void*>(p));
    }
    void* emplace(void* p, const TypeShape& alt) const override {
        if constexpr (Kind == ShapeKind::Variant) {
            return emplace_alternative(*static_cast<T*>(p), alt, std::make_index_sequence<std::variant_size_v<T>>{});
        } else if constexpr (Kind == ShapeKind::Any) {
            return alt.emplace_into_any(*static_cast<std::any*>(p));
        } else {
            return nullptr;
        }
    }

private:
    template<std::size_t... I>
    void add_fields(std::index_sequence<I...>) {
        (add_field<I>(), ...);
    }

    template<std::size_t I>
    void add_field() {
        using Members = introspection::Members<T>;
        if constexpr (Members::template is_json<I>()) {
            m_fields.push_back(FieldShape{
                Members::template name<I>(),
                Members::template json_name<I>(),
                &shape_of<typename Members::template value_type<I>>,
                [](void* object) -> void* {
                    return Members::template slot<I>(*static_cast<T*>(object));
                }});
        }
    }

    template<std::size_t... I>
    static bool assign_alternative(T& v, const std::any& a, std::index_sequence<I...>) {
        bool done = false;
        ((done = done || try_assign_alternative<I>(v, a)), ...);
        return done;
    }

    template<std::size_t I>
    static bool try_assign_alternative(T& v, const std::any& a) {
        using A = std::variant_alternative_t<I, T>;
        if constexpr (std::is_copy_constructible_v<A>) {
            if (const A* alt = std::any_cast<A>(&a)) {
                v.template emplace<I>(*alt);
                return true;
            }
        }
        return false;
    }

    template<std::size_t... I>
    static std::vector<const TypeShape*> collect_alternatives(std::index_sequence<I...>) {
        std::vector<const TypeShape*> out;
        (append_alternative<std::variant_alternative_t<I, T>>(out), ...);
        return out;
    }

    template<class A>
    static void append_alternative(std::vector<const TypeShape*>& out) {
        if constexpr (!std::is_same_v<A, std::monostate>) {
            out.push_back(&shape_of<A>());
        }
    }

    template<std::size_t... I>
    static void* emplace_alternative(T& v, const TypeShape& alt, std::index_sequence<I...>) {
        void* out = nullptr;
        ((out = out ? out : try_emplace_alternative<I>(v, alt)), ...);
        return out;
    }

    template<std::size_t I>
    static void* try_emplace_alternative(T& v, const TypeShape& alt) {
        using A = std::variant_alternative_t<I, T>;
        if constexpr (std::is_same_v<A, std::monostate> || !std::is_default_constructible_v<A>) {
            return nullptr;
        } else {
            if (alt.type() != std::type_index(typeid(A))) {
                return nullptr;
            }
            return &v.template emplace<I>();
        }
    }

    std::vector<FieldShape> m_fields;
};

} // namespace detail

template<class T>
const TypeShape& shape_of() {
    static const detail::ShapeImpl<T> shape;
    static const bool registered = (ShapeRegistry::instance().add(shape), true);
    (void)registered;
    return shape;
}

// Shape of a type seen at runtime inside a std::any. Only types whose shape was
// requested before (plus the builtin scalars) can be found.
inline const TypeShape* find_shape(std::type_index type) {
    static const bool builtins = [] {
        shape_of<bool>();
        shape_of<int>();
        shape_of<unsigned>();
        shape_of<long>();
        shape_of<unsigned long>();
        shape_of<long long>();
        shape_of<unsigned long long>();
        shape_of<float>();
        shape_of<double>();
        shape_of<std::string>();
        shape_of<std::vector<std::string>>();
        shape_of<std::vector<std::any>>();
        shape_of<std::map<std::string, std::any>>();
        return true;
    }();
    (void)builtins;
    const TypeShape* found = ShapeRegistry::instance().find(type);
    if (!found) {
        JSONMEND_LOG_WARN("no shape registered for runtime type {}; value is treated as opaque", type.name());
    }
    return found;
}

// Untyped handle to a value together with its shape.
struct ValueRef {
    void* ptr = nullptr;
    const TypeShape* shape = nullptr;

    explicit operator bool() const {
        return ptr != nullptr && shape != nullptr;
    }
    ShapeKind kind() const {
        return shape->kind();
    }
    bool is_zero() const {
        return shape->is_zero(ptr);
    }
};

template<class T>
ValueRef make_ref(T& v) {
    return ValueRef{const_cast<std::remove_const_t<T>*>(std::addressof(v)), &shape_of<std::remove_const_t<T>>()};
}

inline bool is_indirect(ShapeKind k) {
    return k == ShapeKind::Reference || k == ShapeKind::Variant || k == ShapeKind::Any;
}

// One level of indirection: pointer target, active variant alternative or any payload.
inline ValueRef step(ValueRef v) {
    if (!v) {
        return {};
    }
    switch (v.kind()) {
    case ShapeKind::Reference:
        return ValueRef{v.shape->deref(v.ptr), v.shape->target()};
    case ShapeKind::Variant:
    case ShapeKind::Any:
        return ValueRef{v.shape->active_value(v.ptr), v.shape->active_shape(v.ptr)};
    default:
        return v;
    }
}

// Follows indirections down to a concrete value. Null ValueRef when any level is empty.
inline ValueRef unwrap(ValueRef v) {
    while (v && is_indirect(v.kind())) {
        v = step(v);
    }
    return v;
}

inline const TypeShape& static_unwrap(const TypeShape& s) {
    const TypeShape* cur = &s;
    while (cur->kind() == ShapeKind::Reference) {
        cur = cur->target();
    }
    return *cur;
}

// Objects and polymorphic slots are walked into; anything else is a leaf to the walker.
inline bool is_walkable(const TypeShape& s) {
    const ShapeKind k = static_unwrap(s).kind();
    return k == ShapeKind::Object || k == ShapeKind::Variant || k == ShapeKind::Any;
}

} // namespace JsonMend
