#pragma once
#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

namespace routing {

// Caps how much request work runs at once. A slot stays taken for as long as
// the ticket that claimed it is alive, on whichever thread it ends up.
class AdmissionGate {
public:
    class Ticket {
    public:
        Ticket(Ticket&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        Ticket& operator=(Ticket&&) = delete;

        ~Ticket() {
            if (gate_) {
                gate_->active_.fetch_sub(1);
            }
        }

    private:
        friend class AdmissionGate;
        explicit Ticket(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_;
    };

    explicit AdmissionGate(size_t capacity) : capacity_(capacity) {}

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Empty when every slot is taken
    std::optional<Ticket> tryAcquire() {
        size_t current = active_.load();
        while (current < capacity_) {
            if (active_.compare_exchange_weak(current, current + 1)) {
                return Ticket(this);
            }
        }
        return std::nullopt;
    }

    size_t active() const { return active_.load(); }
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::atomic<size_t> active_{0};
};

} // namespace routing
