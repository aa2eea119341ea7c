#pragma once

#include <codegrader/common/expected.hpp>
#include <codegrader/common/formatters/enum.hpp>

#include <boost/describe/enum.hpp>
#include <boost/preprocessor/cat.hpp>

namespace codegrader {

/// Failures of the grading machinery itself. Anything that is the student's fault is an
/// ExecutionOutcome, never an ErrorKind.
// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,           ///< An internal operation exceeded its own deadline (not a student timeout)
    SyscallFailure,     ///< A Linux syscall failed
    SandboxUnavailable, ///< The sandbox interpreter could not be launched
    ProtocolError,      ///< The sandbox harness produced output we could not understand
    ServiceBusy,        ///< Admission was refused; the caller may retry later
    Cancelled,          ///< The grading request was cancelled by its caller
    UnknownError,       ///< As named; use this as little as possible
};

BOOST_DESCRIBE_ENUM(ErrorKind, TimedOut, SyscallFailure, SandboxUnavailable, ProtocolError, ServiceBusy, Cancelled,
                    UnknownError)

/// Whether a client can expect a retry of the same request to succeed
constexpr bool is_retryable(ErrorKind kind) noexcept {
    return kind != ErrorKind::Cancelled;
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace codegrader

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::codegrader::ErrorKind;                                                                        \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
