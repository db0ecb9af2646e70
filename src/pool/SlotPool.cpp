#include "pool/SlotPool.h"

#include <stdexcept>
#include <string>

namespace termrelay::pool {

SlotPool::SlotPool() {
    for (int slot = 0; slot < kCapacity; ++slot) free_.insert(slot);
}

std::optional<int> SlotPool::acquire() {
    if (free_.empty()) return std::nullopt;

    const int slot = *free_.begin();
    free_.erase(free_.begin());
    assigned_.insert(slot);
    return slot;
}

bool SlotPool::release(int slot) {
    if (slot < 0 || slot >= kCapacity) {
        throw std::out_of_range("slot out of range: " + std::to_string(slot));
    }
    if (assigned_.erase(slot) == 0) return false;
    free_.insert(slot);
    return true;
}

bool SlotPool::is_assigned(int slot) const {
    return assigned_.count(slot) != 0;
}

} // namespace termrelay::pool
