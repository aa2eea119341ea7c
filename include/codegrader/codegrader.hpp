#pragma once

#include <codegrader/common/error_types.hpp>      // IWYU pragma: export
#include <codegrader/common/expected.hpp>         // IWYU pragma: export
#include <codegrader/engine/admission_gate.hpp>   // IWYU pragma: export
#include <codegrader/engine/engine_config.hpp>    // IWYU pragma: export
#include <codegrader/engine/orchestrator.hpp>     // IWYU pragma: export
#include <codegrader/engine/worker_pool.hpp>      // IWYU pragma: export
#include <codegrader/grading/comparator.hpp>      // IWYU pragma: export
#include <codegrader/grading/scorer.hpp>          // IWYU pragma: export
#include <codegrader/grading/submission.hpp>      // IWYU pragma: export
#include <codegrader/grading/validator.hpp>       // IWYU pragma: export
#include <codegrader/grading/value.hpp>           // IWYU pragma: export
#include <codegrader/logging.hpp>                 // IWYU pragma: export
#include <codegrader/sandbox/sandbox.hpp>         // IWYU pragma: export
