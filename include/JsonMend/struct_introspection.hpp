#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "options.hpp"

namespace JsonMend {

namespace introspection {

// Member-by-index view of an aggregate, backed by PFR.
template<class T>
struct Members {
    using Struct = std::remove_cv_t<T>;

    static constexpr std::size_t count = pfr::tuple_size_v<Struct>;

    template<std::size_t I>
    using member_type = std::remove_cv_t<pfr::tuple_element_t<I, Struct>>;

    template<std::size_t I>
    using value_type = typename MemberTraits<member_type<I>>::value_type;

    // C++ member name, used for error paths.
    template<std::size_t I>
    static constexpr std::string_view name() {
        return pfr::get_name<I, Struct>();
    }

    // JSON property name: key<"..."> when annotated, the member name otherwise.
    template<std::size_t I>
    static constexpr std::string_view json_name() {
        if constexpr (member_has_key_v<member_type<I>>) {
            return member_options_t<member_type<I>>::template get_option<options::detail::key_tag>::name.view();
        } else {
            return name<I>();
        }
    }

    template<std::size_t I>
    static constexpr bool is_json() {
        return member_is_json_v<member_type<I>>;
    }

    // Address of the member's value, looking through Annotated<>.
    template<std::size_t I>
    static value_type<I>* slot(Struct& s) {
        return MemberTraits<member_type<I>>::slot(pfr::get<I>(s));
    }
};

} // namespace introspection

} // namespace JsonMend
