#pragma once

#include "app/app.hpp" // IWYU pragma: export

#include <codegrader/grading/submission.hpp>

namespace codegrader {

/// `codegrader grade`: grades one request file and reports on stdout
class GradeApp final : public App
{
public:
    using App::App;

    /// Number of failed test cases, saturated to what an exit status can hold
    static int exit_code_for(const GradingSummary& summary);

    static constexpr int EXIT_REQUEST_ERROR = 2;
    static constexpr int EXIT_ENGINE_ERROR = 3;

private:
    int run_impl() override;
};

} // namespace codegrader
