#pragma once

namespace codegrader {

/// Percentage of passed tests, rounded half-up. 0 when there are no tests.
/// Computed in integers so that e.g. 1/8 (12.5%) reliably rounds to 13.
constexpr int compute_score(int passed, int total) {
    if (total <= 0) {
        return 0;
    }

    return (passed * 200 + total) / (total * 2);
}

static_assert(compute_score(0, 0) == 0);
static_assert(compute_score(1, 1) == 100);
static_assert(compute_score(1, 8) == 13);
static_assert(compute_score(1, 3) == 33);
static_assert(compute_score(2, 3) == 67);

} // namespace codegrader
