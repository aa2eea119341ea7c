#pragma once

#include <codegrader/common/class_traits.hpp>
#include <codegrader/common/error_types.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace codegrader {

/// Bounds the number of grading requests in flight.
///
/// At most ``max_active`` requests hold a ticket at a time. Up to ``max_queued`` more may wait for
/// one, each for at most ``queue_timeout``. Everything else is refused with ErrorKind::ServiceBusy.
class AdmissionGate : NonMovable
{
public:
    /// Proof of admission. Returns its slot to the gate when destroyed.
    class Ticket : NonCopyable
    {
    public:
        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& rhs) noexcept;
        ~Ticket();

    private:
        friend class AdmissionGate;

        explicit Ticket(AdmissionGate* gate)
            : gate_{gate} {}

        AdmissionGate* gate_;
    };

    AdmissionGate(std::size_t max_active, std::size_t max_queued, std::chrono::milliseconds queue_timeout);

    /// Blocks for at most the queue timeout
    Result<Ticket> acquire();

    std::size_t active() const;

    std::size_t waiting() const;

    std::size_t get_max_active() const { return max_active_; }

    std::size_t get_max_queued() const { return max_queued_; }

private:
    void release();

    std::size_t max_active_;
    std::size_t max_queued_;
    std::chrono::milliseconds queue_timeout_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t active_{};
    std::size_t waiting_{};
};

} // namespace codegrader
