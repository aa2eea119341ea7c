#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

namespace codegrader {

/// Writes exactly the body the HTTP service would have answered with
class JsonSerializer : public Serializer
{
public:
    explicit JsonSerializer(Sink& sink, bool pretty = false)
        : Serializer{sink}
        , pretty_{pretty} {}

    void on_summary(const CodeSubmission& submission, const GradingSummary& summary) override;
    void on_validation_error(const ValidationError& error) override;
    void on_engine_error(ErrorKind kind) override;

    void finalize() override;

private:
    bool pretty_;
};

} // namespace codegrader
