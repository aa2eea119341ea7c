#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/describe/enumerators.hpp>
#include <fmt/format.h>

#include <string_view>
#include <type_traits>

namespace codegrader {

template <typename Enum>
concept DescribedEnum = std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value;

/// Formats any described enum by its enumerator name.
/// Found by fmt through ADL, so it covers enums declared in namespace codegrader or nested in its classes.
template <DescribedEnum Enum>
constexpr std::string_view format_as(Enum value) {
    return boost::describe::enum_to_string(value, "<unknown>");
}

} // namespace codegrader
