#include <codegrader/engine/admission_gate.hpp>

#include <codegrader/common/error_types.hpp>
#include <codegrader/logging.hpp>

#include <libassert/assert.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <utility>

namespace codegrader {

AdmissionGate::Ticket::Ticket(Ticket&& other) noexcept
    : NonCopyable{std::move(other)}
    , gate_{std::exchange(other.gate_, nullptr)} {}

AdmissionGate::Ticket& AdmissionGate::Ticket::operator=(Ticket&& rhs) noexcept {
    if (this != &rhs) {
        if (gate_ != nullptr) {
            gate_->release();
        }
        gate_ = std::exchange(rhs.gate_, nullptr);
    }

    return *this;
}

AdmissionGate::Ticket::~Ticket() {
    if (gate_ != nullptr) {
        gate_->release();
    }
}

AdmissionGate::AdmissionGate(std::size_t max_active, std::size_t max_queued, std::chrono::milliseconds queue_timeout)
    : max_active_{max_active}
    , max_queued_{max_queued}
    , queue_timeout_{queue_timeout} {
    ASSERT(max_active_ > 0, "An admission gate must admit something");
}

Result<AdmissionGate::Ticket> AdmissionGate::acquire() {
    std::unique_lock lock{mutex_};

    // Don't jump ahead of anyone already waiting
    if (active_ < max_active_ && waiting_ == 0) {
        ++active_;
        return Ticket{this};
    }

    if (waiting_ >= max_queued_) {
        LOG_DEBUG("Admission refused: {} active, {} waiting", active_, waiting_);
        return ErrorKind::ServiceBusy;
    }

    ++waiting_;
    const bool admitted = cv_.wait_for(lock, queue_timeout_, [this] { return active_ < max_active_; });
    --waiting_;

    if (!admitted) {
        LOG_DEBUG("Admission timed out after {} with {} active", queue_timeout_, active_);
        return ErrorKind::ServiceBusy;
    }

    ++active_;
    return Ticket{this};
}

std::size_t AdmissionGate::active() const {
    std::lock_guard lock{mutex_};
    return active_;
}

std::size_t AdmissionGate::waiting() const {
    std::lock_guard lock{mutex_};
    return waiting_;
}

void AdmissionGate::release() {
    {
        std::lock_guard lock{mutex_};
        DEBUG_ASSERT(active_ > 0);
        --active_;
    }
    cv_.notify_one();
}

} // namespace codegrader
