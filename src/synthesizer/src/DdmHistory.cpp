#include "DdmHistory.hpp"
#include <stdexcept>

DdmHistory::DdmHistory(size_t key_count, size_t window)
    : window_(window), rings_(key_count) {
    if (window_ == 0) {
        throw std::invalid_argument("DDM history window must be positive");
    }
}

size_t DdmHistory::record(const DdmObservation& observation) {
    Ring& ring = rings_.at(observation.key_ordinal);
    if (ring.slots.empty()) {
        ring.slots.resize(window_);
    }

    if (ring.count < window_) {
        ring.slots[(ring.head + ring.count) % window_] = observation;
        ++ring.count;
    } else {
        ring.slots[ring.head] = observation;
        ring.head = (ring.head + 1) % window_;
    }
    return ++ring.total;
}

DdmHistoryView DdmHistory::view(size_t key_ordinal) const {
    const Ring& ring = rings_.at(key_ordinal);
    if (ring.count == 0) return DdmHistoryView();
    return DdmHistoryView(&ring.slots, ring.head, ring.count);
}
