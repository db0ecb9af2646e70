#pragma once

#include <cstddef>
#include <optional>
#include <set>

namespace termrelay::pool {

// The eight globally numbered simulator identities. A slot selects which
// simulated host a session impersonates, whichever router asked for it.
// Invariant: free_count() + assigned_count() == kCapacity.
class SlotPool {
public:
    static constexpr int kCapacity = 8;

    SlotPool();

    // Lowest free slot, or nullopt when all are assigned.
    std::optional<int> acquire();

    // Returns false (and changes nothing) if the slot was not assigned.
    // Throws std::out_of_range for numbers outside 0..kCapacity-1.
    bool release(int slot);

    bool is_assigned(int slot) const;
    std::size_t free_count() const noexcept { return free_.size(); }
    std::size_t assigned_count() const noexcept { return assigned_.size(); }
    bool exhausted() const noexcept { return free_.empty(); }

private:
    std::set<int> free_;
    std::set<int> assigned_;
};

} // namespace termrelay::pool
