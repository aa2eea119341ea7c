#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace codegrader {

/// Copy of ``source`` of the same length in which everything but top-level code is blanked out:
/// comments, string, template and regular expression literals, and anything nested inside braces
/// become spaces.
/// Newlines are kept.
std::string mask_nested_code(std::string_view source);

/// Names of functions declared at the top level of a JavaScript source, in source order.
///
/// Recognized forms:
///   function name(...)            async function name(...)        function* name(...)
///   const name = (...) => ...     const name = arg => ...         const name = function ...
/// (``let`` and ``var`` work the same as ``const``)
///
/// A name declared more than once is listed at its last declaration.
std::vector<std::string> find_entry_candidates(std::string_view source);

} // namespace codegrader
