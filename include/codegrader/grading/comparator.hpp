#pragma once

#include <codegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>

#include <string>
#include <string_view>

namespace codegrader {

/// Which rule decided a comparison
enum class MatchTier {
    Structural, ///< Both sides were JSON documents
    Numeric,    ///< Both sides were bare numbers
    Exact,      ///< Plain string equality
};

BOOST_DESCRIBE_ENUM(MatchTier, Structural, Numeric, Exact)

struct MatchDecision
{
    bool equal;
    MatchTier tier;
};

/// Absolute tolerance for numeric comparisons, in both the Structural and Numeric tiers
inline constexpr double DEFAULT_EPSILON = 1e-9;

/// Trims surrounding whitespace and converts "\r\n" and lone "\r" to "\n"
std::string normalize_output(std::string_view text);

/// Decides whether a submission's output matches the expected output.
///
/// Both sides are normalized (see normalize_output), then:
///   1. if both parse as JSON, they are compared structurally: object key order is irrelevant,
///      array element order is significant;
///   2. otherwise, if both parse as numbers, they are compared within ``epsilon`` (so "5" == "5.0");
///   3. otherwise, the normalized strings must be identical.
MatchDecision compare_outputs(std::string_view actual, std::string_view expected,
                              double epsilon = DEFAULT_EPSILON);

inline bool matches(std::string_view actual, std::string_view expected) {
    return compare_outputs(actual, expected).equal;
}

} // namespace codegrader
