#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <codegrader/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace codegrader {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Exit status of the program
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(EXIT_INTERNAL_ERROR);
    }

    const ProgramOptions OPTS;

    static constexpr int EXIT_INTERNAL_ERROR = 255;

protected:
    virtual int run_impl() = 0;
};

} // namespace codegrader
