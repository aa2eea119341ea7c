#pragma once

#include "output/sink.hpp"

#include <codegrader/common/class_traits.hpp>
#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

namespace codegrader {

/// Renders the outcome of grading one request
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink)
        : sink_{sink} {}

    virtual ~Serializer() = default;

    virtual void on_summary(const CodeSubmission& submission, const GradingSummary& summary) = 0;
    virtual void on_validation_error(const ValidationError& error) = 0;
    virtual void on_engine_error(ErrorKind kind) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
};

} // namespace codegrader
