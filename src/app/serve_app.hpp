#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace codegrader {

/// `codegrader serve`: the HTTP grading service. Runs until SIGINT or SIGTERM.
class ServeApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace codegrader
