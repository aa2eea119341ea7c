#include "common/terminal_checks.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/common/expected.hpp>
#include <codegrader/common/linux.hpp>

#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <sys/ioctl.h>
#include <unistd.h>

namespace codegrader {

// Same heuristic spdlog uses for its color sinks
bool is_color_terminal() noexcept {
    static const bool RESULT = []() {
        if (std::getenv("NO_COLOR") != nullptr) {
            return false;
        }

        if (std::getenv("COLORTERM") != nullptr) {
            return true;
        }

        static constexpr std::array<const char*, 16> TERMS = {{"ansi", "color", "console", "cygwin", "gnome", "konsole",
                                                               "kterm", "linux", "msys", "putty", "rxvt", "screen",
                                                               "vt100", "xterm", "alacritty", "vt102"}};

        const char* env_term_p = std::getenv("TERM");

        if (env_term_p == nullptr) {
            return false;
        }

        return ranges::any_of(TERMS, [&](const char* term) { return std::strstr(env_term_p, term) != nullptr; });
    }();

    return RESULT;
}

bool in_terminal(FILE* file) noexcept {
    return ::isatty(fileno(file)) != 0;
}

Expected<winsize> terminal_size(FILE* file) noexcept {
    winsize size{};

    TRY(linux::ioctl(fileno(file), TIOCGWINSZ, &size));

    return size;
}

} // namespace codegrader
