#pragma once

#include <string_view>

namespace codegrader {

/// JavaScript program passed to ``node -e``. It reads one JSON request from stdin, runs the submission
/// in a fresh ``vm`` context and writes one JSON reply line to stdout.
///
/// Request: {"mode": "compile" | "execute", "code": string, "input": string, "candidates": [string]}
/// Reply:   {"status": "ok", "value": string}
///          {"status": "compile_error" | "runtime_error" | "harness_error", "message": string}
std::string_view node_harness_script();

} // namespace codegrader
