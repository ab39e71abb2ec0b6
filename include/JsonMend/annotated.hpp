#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace JsonMend {

namespace detail {

template<class Opt, class Tag>
concept option_tagged_as = requires { typename Opt::tag; } && std::same_as<typename Opt::tag, Tag>;

template<class Tag, class... Opts>
struct find_option { using type = void; };

template<class Tag, class First, class... Rest>
struct find_option<Tag, First, Rest...> {
    using type = std::conditional_t<option_tagged_as<First, Tag>, First, typename find_option<Tag, Rest...>::type>;
};

} // namespace detail

template<class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);

    // First option tagged `Tag`, void when there is none.
    template<class Tag>
    using get_option = typename detail::find_option<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<get_option<Tag>>;
};

// A struct member with compile-time options attached:
//   Annotated<std::string, options::key<"zip_code">> zip;
// Shapes, the codec and the walker see only `value`.
template <class T, typename... Options>
struct Annotated {
    using value_type = T;
    using options = OptionsPack<Options...>;

    T value{};

    constexpr Annotated() = default;

    template<class U>
        requires std::convertible_to<U, T> && (!std::same_as<std::remove_cvref_t<U>, Annotated>)
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T> && (!std::same_as<std::remove_cvref_t<U>, Annotated>)
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

template<class T>
struct is_annotated : std::false_type {};

template<class T, class... Opts>
struct is_annotated<Annotated<T, Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_annotated_v = is_annotated<T>::value;

// How a struct member of type Field is seen: its value type, its options and
// access to the value slot.
template<class Field>
struct MemberTraits {
    using value_type = Field;
    using options = OptionsPack<>;

    static constexpr Field* slot(Field& f) {
        return std::addressof(f);
    }
};

template<class T, class... Opts>
struct MemberTraits<Annotated<T, Opts...>> {
    static_assert(!is_annotated_v<T>, "[[[ JsonMend ]]] Annotated<Annotated<...>> is not supported");
    using value_type = T;
    using options = OptionsPack<Opts...>;

    static constexpr T* slot(Annotated<T, Opts...>& f) {
        return std::addressof(f.value);
    }
};

template<class T, class... Opts>
struct MemberTraits<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonMend ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct MemberTraits<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ JsonMend ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

} // namespace JsonMend
