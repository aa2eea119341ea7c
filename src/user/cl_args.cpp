#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"

#include <codegrader/common/expected.hpp>
#include <codegrader/logging.hpp>
#include <codegrader/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace codegrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ CODEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , serve_parser_{"serve", CODEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , grade_parser_{"grade", CODEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

template <std::integral T>
T parse_number(std::string_view option, const std::string& value) {
    T result{};

    const char* last = value.data() + value.size();
    auto [ptr, err] = std::from_chars(value.data(), last, result);

    if (err != std::errc{} || ptr != last) {
        throw std::invalid_argument(fmt::format("Invalid value {:?} for {}", value, option));
    }

    return result;
}

} // namespace

void CommandLineArgs::setup_parser() {
    constexpr std::size_t DEFAULT_MAX_WIDTH = 80;

    std::size_t max_width = DEFAULT_MAX_WIDTH;

    if (auto term_sz = terminal_size(stdout); term_sz && term_sz->ws_col != 0) {
        max_width = term_sz->ws_col * std::size_t{3} / 4;
    } else {
        LOG_DEBUG("Failed to get terminal size. Setting max width to {}", DEFAULT_MAX_WIDTH);
    }

    for (argparse::ArgumentParser* parser : {&arg_parser_, &serve_parser_, &grade_parser_}) {
        parser->set_usage_max_line_width(max_width);
    }

    arg_parser_.add_description(fmt::format("codegrader v{}: grades JavaScript submissions against test cases",
                                            CODEGRADER_VERSION_STRING));

    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(CODEGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    {
        // Block to reduce scope of `using enum`

        using enum spdlog::level::level_enum;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    if (opts_buffer_.log_level == trace) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.log_level = static_cast<spdlog::level::level_enum>(opts_buffer_.log_level - 1);
                })
            .append()
            .help("Log more (repeatable, down to trace)");

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    if (opts_buffer_.log_level == off) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.log_level = static_cast<spdlog::level::level_enum>(opts_buffer_.log_level + 1);
                })
            .append()
            .help("Log less (repeatable, up to off)");

        opts_buffer_.log_level = ProgramOptions::DEFAULT_LOG_LEVEL;
    }

    // ###### serve

    serve_parser_.add_description("Run the HTTP grading service");

    add_engine_arguments(serve_parser_);
    add_server_arguments(serve_parser_);

    // ###### grade

    grade_parser_.add_description("Grade a single request file (the JSON body of a grading request) locally.\n"
                                  "Exits with the number of failed test cases.");

    grade_parser_.add_argument("request")
        .metavar("REQUEST_FILE")
        .action([this] (const std::string& opt) {
                opts_buffer_.request_file = opt;
        })
        .help("JSON file of the form {\"code\", \"language\", \"testCases\"}");

    grade_parser_.add_argument("--json")
        .flag()
        .store_into(opts_buffer_.json_output)
        .help("Print the JSON response body instead of a readable report");

    grade_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    add_engine_arguments(grade_parser_);

    // clang-format on

    arg_parser_.add_subparser(serve_parser_);
    arg_parser_.add_subparser(grade_parser_);
}

void CommandLineArgs::add_engine_arguments(argparse::ArgumentParser& parser) {
    const EngineConfig defaults{};

    // clang-format off
    parser.add_argument("-t", "--timeout-ms")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.limits.timeout = std::chrono::milliseconds{parse_number<long>("--timeout-ms", opt)};
        })
        .help(fmt::format("Wall-clock budget of each test case (default: {})", defaults.limits.timeout.count()));

    parser.add_argument("-m", "--memory-mb")
        .metavar("MB")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.limits.memory_mb = parse_number<std::size_t>("--memory-mb", opt);
        })
        .help(fmt::format("Heap ceiling of each test case (default: {})", defaults.limits.memory_mb));

    parser.add_argument("--max-code-bytes")
        .metavar("BYTES")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.validation.max_code_bytes = parse_number<std::size_t>("--max-code-bytes", opt);
        })
        .help(fmt::format("Largest accepted submission (default: {})", defaults.validation.max_code_bytes));

    parser.add_argument("--max-test-cases")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.validation.max_test_cases = parse_number<std::size_t>("--max-test-cases", opt);
        })
        .help(fmt::format("Most test cases accepted in one request (default: {})", defaults.validation.max_test_cases));

    parser.add_argument("--node")
        .metavar("PATH")
        .nargs(1)
        .store_into(opts_buffer_.engine.node_path)
        .help(fmt::format("Node.js interpreter (default: {})", defaults.node_path));

    parser.add_argument("--node-flag")
        .metavar("FLAG")
        .nargs(1)
        .append()
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.node_flags.push_back(opt);
        })
        .help("Extra interpreter flag, e.g. --node-flag=--stack-size=500 (repeatable)");

    parser.add_argument("--rss-overhead-mb")
        .metavar("MB")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.rss_overhead_mb = parse_number<std::size_t>("--rss-overhead-mb", opt);
        })
        .help(fmt::format("Resident memory allowed on top of the heap ceiling (default: {})", defaults.rss_overhead_mb));

    parser.add_argument("--max-output-bytes")
        .metavar("BYTES")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.max_output_bytes = parse_number<std::size_t>("--max-output-bytes", opt);
        })
        .help(fmt::format("Output a single test case may produce (default: {})", defaults.max_output_bytes));

    parser.add_argument("--isolate")
        .flag()
        .store_into(opts_buffer_.engine.isolate_namespaces)
        .help("Run submissions in fresh user and network namespaces where the kernel allows it");

    parser.add_argument("-j", "--workers")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.workers = parse_number<std::size_t>("--workers", opt);
        })
        .help("Test cases run in parallel (default: one per hardware thread)");
    // clang-format on
}

void CommandLineArgs::add_server_arguments(argparse::ArgumentParser& parser) {
    const EngineConfig engine_defaults{};
    const ServerConfig defaults{};

    // clang-format off
    parser.add_argument("--host")
        .metavar("ADDR")
        .nargs(1)
        .store_into(opts_buffer_.server.host)
        .help(fmt::format("Address to listen on (default: {})", defaults.host));

    parser.add_argument("-p", "--port")
        .metavar("PORT")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.server.port = parse_number<int>("--port", opt);
        })
        .help(fmt::format("Port to listen on; 0 picks a free one (default: {})", defaults.port));

    parser.add_argument("--threads")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.server.threads = parse_number<std::size_t>("--threads", opt);
        })
        .help("HTTP worker threads (default: enough for every admitted and queued request, plus spares)");

    parser.add_argument("--max-request-bytes")
        .metavar("BYTES")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.server.max_request_bytes = parse_number<std::size_t>("--max-request-bytes", opt);
        })
        .help(fmt::format("Largest accepted request body (default: {})", defaults.max_request_bytes));

    parser.add_argument("--max-active")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.max_active_requests = parse_number<std::size_t>("--max-active", opt);
        })
        .help(fmt::format("Requests graded at the same time (default: {})", engine_defaults.max_active_requests));

    parser.add_argument("--max-queued")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.max_queued_requests = parse_number<std::size_t>("--max-queued", opt);
        })
        .help(fmt::format("Requests allowed to wait for a slot (default: {})", engine_defaults.max_queued_requests));

    parser.add_argument("--queue-timeout-ms")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.engine.queue_timeout =
                    std::chrono::milliseconds{parse_number<long>("--queue-timeout-ms", opt)};
        })
        .help(fmt::format("How long a request may wait for a slot before being refused (default: {})",
                          engine_defaults.queue_timeout.count()));
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (arg_parser_.is_subcommand_used(serve_parser_)) {
        opts_buffer_.command = ProgramOptions::Command::Serve;
    } else if (arg_parser_.is_subcommand_used(grade_parser_)) {
        opts_buffer_.command = ProgramOptions::Command::Grade;
    } else {
        return std::string{"A subcommand (serve or grade) is required"};
    }

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    if (arg_parser_.is_subcommand_used(grade_parser_)) {
        return grade_parser_.help().str();
    }

    if (arg_parser_.is_subcommand_used(serve_parser_)) {
        return serve_parser_.help().str();
    }

    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace codegrader
