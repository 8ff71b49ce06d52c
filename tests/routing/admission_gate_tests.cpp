#include <catch2/catch_test_macros.hpp>
#include "../../include/routing/AdmissionGate.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using routing::AdmissionGate;

TEST_CASE("AdmissionGate refuses work beyond its capacity", "[AdmissionGate]") {
    AdmissionGate gate(2);

    auto first = gate.tryAcquire();
    auto second = gate.tryAcquire();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(gate.active() == 2);
    REQUIRE_FALSE(gate.tryAcquire().has_value());

    // Releasing a ticket frees its slot
    first.reset();
    REQUIRE(gate.active() == 1);
    auto third = gate.tryAcquire();
    REQUIRE(third.has_value());
    REQUIRE(gate.active() == 2);
}

TEST_CASE("AdmissionGate keeps the slot while a moved ticket lives", "[AdmissionGate]") {
    AdmissionGate gate(1);
    std::atomic<bool> release{false};

    auto ticket = gate.tryAcquire();
    REQUIRE(ticket.has_value());
    std::thread worker([&release, held = std::move(*ticket)]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });

    ticket.reset();
    REQUIRE(gate.active() == 1);
    REQUIRE_FALSE(gate.tryAcquire().has_value());

    release = true;
    worker.join();
    REQUIRE(gate.active() == 0);
    REQUIRE(gate.tryAcquire().has_value());
}

TEST_CASE("AdmissionGate admits exactly its capacity under contention", "[AdmissionGate]") {
    constexpr size_t kCapacity = 3;
    constexpr size_t kCallers = 16;
    AdmissionGate gate(kCapacity);

    std::vector<std::optional<AdmissionGate::Ticket>> tickets(kCallers);
    std::vector<std::thread> callers;
    for (size_t i = 0; i < kCallers; ++i) {
        callers.emplace_back([&gate, &tickets, i] {
            auto claimed = gate.tryAcquire();
            if (claimed) {
                tickets[i].emplace(std::move(*claimed));
            }
        });
    }
    for (auto& caller : callers) caller.join();

    size_t admitted = 0;
    for (const auto& ticket : tickets) {
        if (ticket) ++admitted;
    }
    REQUIRE(admitted == kCapacity);
    REQUIRE(gate.active() == kCapacity);

    tickets.clear();
    REQUIRE(gate.active() == 0);
}
