#pragma once

#include "user/program_options.hpp"

#include <codegrader/common/expected.hpp>

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace codegrader {

/// Wrapper around argparse that fills in a ProgramOptions
///
/// Usage:
///   codegrader [-v|-q] serve [engine options] [server options]
///   codegrader [-v|-q] grade [engine options] [--json] [--color WHEN] REQUEST_FILE
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed and validated program options
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParsers for fields of ProgramOptions
    void setup_parser();

    /// Options that bound the grading engine; shared by both subcommands
    void add_engine_arguments(argparse::ArgumentParser& parser);

    void add_server_arguments(argparse::ArgumentParser& parser);

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    argparse::ArgumentParser serve_parser_;
    argparse::ArgumentParser grade_parser_;
    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};
};

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 1) noexcept;

} // namespace codegrader
