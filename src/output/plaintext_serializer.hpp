#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "user/program_options.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

#include <fmt/base.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace codegrader {

/// Human readable report of a grading run, colored when writing to a terminal
class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option);

    void on_summary(const CodeSubmission& submission, const GradingSummary& summary) override;
    void on_validation_error(const ValidationError& error) override;
    void on_engine_error(ErrorKind kind) override;

    void finalize() override;

private:
    void output_test_result(std::size_t index, const TestCase& test_case, const TestResult& result);
    void output_totals(const GradingSummary& summary);

    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    template <fmt::formattable T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <fmt::formattable T>
    std::string style_str(const T& arg, fmt::text_style style, fmt::format_string<T> fmt = "{}") const;

    /// Conditionally make a word singular or plural based on `count`
    ///
    /// Examples:
    ///  pluralize("test", 0) => "tests"
    ///  pluralize("case", 1) => "case"
    static std::string pluralize(std::string_view root, int count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - FAILED messages, engine and validation errors
    //   success  - PASSED messages
    //   header   - the score line
    //   value    - submission output and expected output
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto HEADER_STYLE = fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <fmt::formattable T>
auto PlainTextSerializer::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <fmt::formattable T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style, fmt::format_string<T> fmt) const {
    if (!do_colorize_) {
        return fmt::vformat(fmt.str, fmt::vargs<T>{arg});
    }

    return fmt::vformat(style, fmt.str, fmt::vargs<T>{arg});
}

} // namespace codegrader
