#include "output/json_serializer.hpp"

#include "server/json_codec.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/grading/submission.hpp>
#include <codegrader/grading/validator.hpp>

#include <nlohmann/json.hpp>

namespace codegrader {

namespace {

constexpr int PRETTY_INDENT = 2;

} // namespace

void JsonSerializer::on_summary(const CodeSubmission& /*submission*/, const GradingSummary& summary) {
    const nlohmann::json body = summary;

    sink_.write(body.dump(pretty_ ? PRETTY_INDENT : -1));
    sink_.write("\n");
}

void JsonSerializer::on_validation_error(const ValidationError& error) {
    sink_.write(validation_error_body(error).dump(pretty_ ? PRETTY_INDENT : -1));
    sink_.write("\n");
}

void JsonSerializer::on_engine_error(ErrorKind kind) {
    sink_.write(engine_error_body(kind).dump(pretty_ ? PRETTY_INDENT : -1));
    sink_.write("\n");
}

void JsonSerializer::finalize() {
    sink_.flush();
}

} // namespace codegrader
