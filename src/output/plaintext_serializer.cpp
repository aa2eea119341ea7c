#include "output/plaintext_serializer.hpp"

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "user/program_options.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>
#include <codegrader/logging.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace codegrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option)
    : Serializer{sink}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_summary(const CodeSubmission& submission, const GradingSummary& summary) {
    sink_.write(LINE_DIVIDER_EM(terminal_width_) + "\n");

    if (summary.results.empty()) {
        sink_.write("No test cases.\n");
    }

    for (std::size_t i = 0; i < summary.results.size(); ++i) {
        if (i != 0) {
            sink_.write(LINE_DIVIDER(terminal_width_) + "\n");
        }
        output_test_result(i, submission.test_cases.at(i), summary.results[i]);
    }

    sink_.write(LINE_DIVIDER_EM(terminal_width_) + "\n");

    output_totals(summary);
}

void PlainTextSerializer::output_test_result(std::size_t index, const TestCase& test_case, const TestResult& result) {
    std::string label = fmt::format("Test Case {}", index + 1);

    if (test_case.description) {
        label += fmt::format(" ({})", *test_case.description);
    }

    if (result.passed) {
        sink_.write(fmt::format("{}: {}\n", label, style_str("PASSED", SUCCESS_STYLE)));
        return;
    }

    std::string out = fmt::format("{}: {}\n", label, style_str("FAILED", ERROR_STYLE));

    out += fmt::format("  Input    : {}\n", style(test_case.input, VALUE_STYLE));
    out += fmt::format("  Expected : {:?}\n", style(result.expected, VALUE_STYLE));
    out += fmt::format("  Actual   : {:?}\n", style(result.actual, VALUE_STYLE));

    if (result.error) {
        out += fmt::format("  Error    : {}\n", style(*result.error, ERROR_STYLE));
    }

    sink_.write(out);
}

void PlainTextSerializer::output_totals(const GradingSummary& summary) {
    std::string out;

    if (summary.all_passed()) {
        out = fmt::format("{} ({} {})\n", style_str("All tests passed", SUCCESS_STYLE), summary.total_tests,
                          pluralize("test case", summary.total_tests));
    } else {
        // Wide enough for any realistic number of test cases
        static constexpr std::size_t field_width = 10;

        std::string total_msg = fmt::format("{} total", summary.total_tests);
        std::string passed_msg = fmt::format("{} passed", summary.passed_tests);
        std::string failed_msg = fmt::format("{} failed", summary.failed_tests());

        out = fmt::format("{0:<{4}}: {1:>{4}} | {2:>{4}} | {3:>{4}}\n", "Tests", total_msg,
                          style(passed_msg, SUCCESS_STYLE), style(failed_msg, ERROR_STYLE), field_width);
    }

    out += fmt::format("{}\n", style_str(summary.score, HEADER_STYLE, "Score: {}%"));

    sink_.write(out);
}

void PlainTextSerializer::on_validation_error(const ValidationError& error) {
    std::string out = style_str("Invalid request", ERROR_STYLE, "{}: ");

    if (!error.field.empty()) {
        out += fmt::format("{} ", style(error.field, VALUE_STYLE));
    }

    out += fmt::format("{} [{}]\n", error.message, error_code_id(error.code));

    sink_.write(out);
}

void PlainTextSerializer::on_engine_error(ErrorKind kind) {
    std::string what;

    if (kind == ErrorKind::ServiceBusy) {
        what = "The grading engine is at capacity; retry shortly";
    } else if (kind == ErrorKind::Cancelled) {
        what = "Grading was cancelled";
    } else {
        what = fmt::format("The grading engine failed ({}); this is not a problem with the submission", kind);
    }

    sink_.write(style_str(what, is_retryable(kind) ? WARNING_STYLE : ERROR_STYLE, "{}\n"));
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, int count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error() || width.value() == 0) {
        LOG_DEBUG("Could not obtain terminal width. Defaulting to {}", DEFAULT_WIDTH);
        return DEFAULT_WIDTH;
    }

    return width.value();
}

} // namespace codegrader
