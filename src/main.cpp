#include "app/app.hpp"
#include "app/grade_app.hpp"
#include "app/serve_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <codegrader/logging.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace codegrader;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    ProgramOptions options = parse_args_or_exit(args);

    init_loggers(options.log_level);

    std::unique_ptr<App> app;

    if (options.command == ProgramOptions::Command::Serve) {
        app = std::make_unique<ServeApp>(std::move(options));
    } else {
        app = std::make_unique<GradeApp>(std::move(options));
    }

    return app->run();
}
