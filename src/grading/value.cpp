#include <codegrader/grading/value.hpp>

#include <nlohmann/json.hpp>
#include <range/v3/algorithm/equal.hpp>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace codegrader {

namespace {

Value from_json(const nlohmann::json& json) {
    using Kind = nlohmann::json::value_t;

    switch (json.type()) {
    case Kind::null:
        return Value{nullptr};
    case Kind::boolean:
        return Value{json.get<bool>()};
    case Kind::number_integer:
    case Kind::number_unsigned:
    case Kind::number_float:
        return Value{json.get<double>()};
    case Kind::string:
        return Value{json.get<std::string>()};
    case Kind::array: {
        Value::Array array;
        array.reserve(json.size());
        for (const auto& elem : json) {
            array.push_back(from_json(elem));
        }
        return Value{std::move(array)};
    }
    case Kind::object: {
        Value::Object object;
        for (const auto& [key, elem] : json.items()) {
            object.insert_or_assign(key, from_json(elem));
        }
        return Value{std::move(object)};
    }
    case Kind::binary:
    case Kind::discarded:
        break;
    }

    // Neither can come out of the text parser
    return Value{nullptr};
}

nlohmann::json to_json(const Value& value) {
    using enum Value::Type;

    switch (value.type()) {
    case Null:
        return nullptr;
    case Bool:
        return *value.as_bool();
    case Number:
        return *value.as_number();
    case String:
        return *value.as_string();
    case Array: {
        auto array = nlohmann::json::array();
        for (const auto& elem : *value.as_array()) {
            array.push_back(to_json(elem));
        }
        return array;
    }
    case Object: {
        auto object = nlohmann::json::object();
        for (const auto& [key, elem] : *value.as_object()) {
            object[key] = to_json(elem);
        }
        return object;
    }
    }

    return nullptr;
}

bool numbers_equal(double lhs, double rhs, double epsilon) {
    if (!std::isfinite(lhs) || !std::isfinite(rhs)) {
        return false;
    }

    return std::fabs(lhs - rhs) <= epsilon;
}

} // namespace

std::optional<Value> Value::parse_json(std::string_view text) {
    // nlohmann's parser never throws with allow_exceptions = false; failures come back as `discarded`
    auto json = nlohmann::json::parse(text, /*cb=*/nullptr, /*allow_exceptions=*/false);

    if (json.is_discarded()) {
        return std::nullopt;
    }

    return from_json(json);
}

std::optional<double> Value::parse_number(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        // Reject "++1" and "+-1"
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            return std::nullopt;
        }
    }

    if (text.empty()) {
        return std::nullopt;
    }

    double result{};
    const char* const end = text.data() + text.size();
    auto [ptr, errc] = std::from_chars(text.data(), end, result, std::chars_format::general);

    if (errc != std::errc{} || ptr != end || !std::isfinite(result)) {
        return std::nullopt;
    }

    return result;
}

bool Value::equals(const Value& other, double epsilon) const {
    if (type() != other.type()) {
        return false;
    }

    using enum Type;

    switch (type()) {
    case Null:
        return true;
    case Bool:
        return *as_bool() == *other.as_bool();
    case Number:
        return *as_number() == *other.as_number() || numbers_equal(*as_number(), *other.as_number(), epsilon);
    case String:
        return *as_string() == *other.as_string();
    case Array:
        return ranges::equal(*as_array(), *other.as_array(),
                             [epsilon](const Value& lhs, const Value& rhs) { return lhs.equals(rhs, epsilon); });
    case Object: {
        const auto& lhs = *as_object();
        const auto& rhs = *other.as_object();

        // Both maps are sorted by key, so a pairwise walk suffices
        return ranges::equal(lhs, rhs, [epsilon](const auto& lhs_entry, const auto& rhs_entry) {
            return lhs_entry.first == rhs_entry.first && lhs_entry.second.equals(rhs_entry.second, epsilon);
        });
    }
    }

    return false;
}

std::string Value::dump() const {
    return to_json(*this).dump();
}

} // namespace codegrader
