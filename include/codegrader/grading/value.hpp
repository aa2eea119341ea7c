#pragma once

#include <codegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace codegrader {

/// A JSON-shaped value: Null | Bool | Number | String | Array | Object.
///
/// Numbers are IEEE doubles, matching what a JavaScript submission can produce.
/// Object keys are unique and unordered; a duplicated key keeps its last value.
class Value
{
public:
    enum class Type { Null, Bool, Number, String, Array, Object };
    BOOST_DESCRIBE_NESTED_ENUM(Type, Null, Bool, Number, String, Array, Object)

    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value, std::less<>>;

    Value() = default;

    // NOLINTBEGIN(google-explicit-constructor)
    Value(std::nullptr_t) {}
    Value(bool boolean)
        : data_{boolean} {}
    Value(double number)
        : data_{number} {}
    Value(int number)
        : data_{static_cast<double>(number)} {}
    Value(std::string str)
        : data_{std::move(str)} {}
    Value(const char* str)
        : data_{std::string{str}} {}
    Value(Array array)
        : data_{std::move(array)} {}
    Value(Object object)
        : data_{std::move(object)} {}
    // NOLINTEND(google-explicit-constructor)

    /// Parse strict JSON (RFC 8259). std::nullopt if ``text`` is not a single valid JSON document.
    static std::optional<Value> parse_json(std::string_view text);

    /// Parse a bare decimal number, as accepted by strtod, excluding hexadecimal and
    /// non-finite spellings. A leading '+' is allowed.
    static std::optional<double> parse_number(std::string_view text);

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept { return type() == Type::Null; }
    bool is_number() const noexcept { return type() == Type::Number; }

    const bool* as_bool() const noexcept { return std::get_if<bool>(&data_); }
    const double* as_number() const noexcept { return std::get_if<double>(&data_); }
    const std::string* as_string() const noexcept { return std::get_if<std::string>(&data_); }
    const Array* as_array() const noexcept { return std::get_if<Array>(&data_); }
    const Object* as_object() const noexcept { return std::get_if<Object>(&data_); }

    /// Structural equality. Numbers compare equal when they differ by at most ``epsilon``;
    /// array order matters, object key order does not.
    bool equals(const Value& other, double epsilon) const;

    /// Exact structural equality
    bool operator==(const Value& other) const { return equals(other, 0.0); }

    /// Compact JSON rendering, mostly for diagnostics
    std::string dump() const;

private:
    // Index order must match Type
    std::variant<std::monostate, bool, double, std::string, Array, Object> data_;
};

} // namespace codegrader

template <>
struct fmt::formatter<::codegrader::Value> : fmt::formatter<std::string>
{
    auto format(const ::codegrader::Value& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(from.dump(), ctx);
    }
};
