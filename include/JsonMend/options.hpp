#pragma once
#include <string_view>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"

namespace JsonMend {

namespace options {

namespace detail {

struct not_json_tag{};
struct key_tag{};

}

// Member is neither decoded, encoded nor walked.
struct not_json {
    using tag = detail::not_json_tag;
    static constexpr std::string_view to_string() {
        return "not_json";
    }
};

// Overrides the JSON property name of a member.
template<ConstString Name>
struct key {
    static_assert(Name.is_path_safe(), "[[[ JsonMend ]]] json key must be non-empty and free of control characters, '.', '[' and ']'");
    using tag = detail::key_tag;
    static constexpr auto name = Name;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

} // namespace options

// Options attached to a member of type Field (empty for plain members).
template<class Field>
using member_options_t = typename MemberTraits<std::remove_cv_t<Field>>::options;

template<class Field>
inline constexpr bool member_is_json_v = !member_options_t<Field>::template has_option<options::detail::not_json_tag>;

template<class Field>
inline constexpr bool member_has_key_v = member_options_t<Field>::template has_option<options::detail::key_tag>;

} // namespace JsonMend
