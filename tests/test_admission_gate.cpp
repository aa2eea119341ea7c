#include "catch2_custom.hpp"

#include <codegrader/common/error_types.hpp>
#include <codegrader/engine/admission_gate.hpp>

#include <chrono>
#include <future>
#include <optional>
#include <thread>
#include <utility>

using namespace std::chrono_literals;
using codegrader::AdmissionGate;
using codegrader::ErrorKind;

TEST_CASE("Tickets are handed out up to the active limit") {
    AdmissionGate gate{2, 0, 10ms};

    auto first = gate.acquire();
    auto second = gate.acquire();

    REQUIRE(first);
    REQUIRE(second);
    REQUIRE(gate.active() == 2);

    // Nobody may queue, so the third is refused straight away
    auto third = gate.acquire();
    REQUIRE(third == ErrorKind::ServiceBusy);
}

TEST_CASE("Destroying a ticket frees its slot") {
    AdmissionGate gate{1, 0, 10ms};

    {
        auto ticket = gate.acquire();
        REQUIRE(ticket);
        REQUIRE(gate.active() == 1);
    }

    REQUIRE(gate.active() == 0);
    REQUIRE(gate.acquire());
}

TEST_CASE("Moved tickets release once") {
    AdmissionGate gate{1, 0, 10ms};

    {
        auto ticket = gate.acquire();
        REQUIRE(ticket);

        std::optional<AdmissionGate::Ticket> moved;
        moved.emplace(std::move(ticket).value());

        REQUIRE(gate.active() == 1);
    }

    REQUIRE(gate.active() == 0);
}

TEST_CASE("Queued requests time out") {
    AdmissionGate gate{1, 1, 30ms};

    auto holder = gate.acquire();
    REQUIRE(holder);

    const auto start = std::chrono::steady_clock::now();
    auto waiter = gate.acquire();
    const auto waited = std::chrono::steady_clock::now() - start;

    REQUIRE(waiter == ErrorKind::ServiceBusy);
    REQUIRE(waited >= 30ms);
    REQUIRE(gate.waiting() == 0);
}

TEST_CASE("Queued requests are admitted when a slot frees up") {
    AdmissionGate gate{1, 1, 5s};

    std::optional<AdmissionGate::Ticket> holder;
    holder.emplace(gate.acquire().value());

    auto waiter = std::async(std::launch::async, [&gate] { return gate.acquire().has_value(); });

    // Wait until the request is actually queued
    while (gate.waiting() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    // The queue is full now
    REQUIRE(gate.acquire() == ErrorKind::ServiceBusy);

    holder.reset();

    REQUIRE(waiter.get());
    REQUIRE(gate.active() == 0);
}
