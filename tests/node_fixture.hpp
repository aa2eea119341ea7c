#pragma once

#include "sandbox/node_sandbox.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <unistd.h>

/// The node interpreter found when the tests were configured, if it is usable
inline std::optional<std::string> test_node_path() {
#ifdef CODEGRADER_TEST_NODE
    const std::string path = CODEGRADER_TEST_NODE;
    if (std::filesystem::is_regular_file(path) && ::access(path.c_str(), X_OK) == 0) {
        return path;
    }
#endif
    return std::nullopt;
}

/// Skips the current test case when there is no node to run submissions with
#define REQUIRE_NODE_SANDBOX(name)                                                                                     \
    const auto name##_node_path = test_node_path();                                                                    \
    if (!name##_node_path) {                                                                                           \
        SKIP("node is not available");                                                                                 \
    }                                                                                                                  \
    ::codegrader::NodeSandbox name{::codegrader::NodeSandboxOptions{.node_path = *name##_node_path}}
