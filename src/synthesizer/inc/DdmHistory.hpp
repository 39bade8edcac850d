#pragma once

#include "DdmSynthesizer.hpp"
#include <cstddef>
#include <vector>

// Read-only window over one key's ring, oldest observation first
class DdmHistoryView {
public:
    DdmHistoryView() = default;
    DdmHistoryView(const std::vector<DdmObservation>* ring, size_t head, size_t count)
        : ring_(ring), head_(head), count_(count) {}

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    const DdmObservation& operator[](size_t i) const {
        return (*ring_)[(head_ + i) % ring_->size()];
    }

    const DdmObservation& back() const { return (*this)[count_ - 1]; }

private:
    const std::vector<DdmObservation>* ring_ = nullptr;
    size_t head_ = 0;
    size_t count_ = 0;
};

// Last N observations per key; memory is bounded by key count times window
class DdmHistory {
public:
    static constexpr size_t DEFAULT_WINDOW = 24;

    explicit DdmHistory(size_t key_count, size_t window = DEFAULT_WINDOW);

    // Returns the number of observations recorded for the key so far, this one included
    size_t record(const DdmObservation& observation);

    DdmHistoryView view(size_t key_ordinal) const;

    size_t window() const { return window_; }

private:
    struct Ring {
        std::vector<DdmObservation> slots;
        size_t head = 0;
        size_t count = 0;
        size_t total = 0;
    };

    size_t window_;
    std::vector<Ring> rings_;
};
