#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "domain/Types.hpp"

namespace tape::app {

struct MergeResult {
    // Strictly increasing, aligned, duplicate-free.
    std::vector<domain::Candle> clean_batch;
    // Missing [start, end) ranges between the tail and the batch or inside the batch.
    std::vector<domain::TimeRange> gaps;
    std::size_t rejected{0};
    std::size_t duplicates{0};

    bool complete() const noexcept { return gaps.empty(); }
};

// Turns raw exchange rows for one series into a batch the store accepts.
// Invalid rows are logged and dropped, never thrown.
class CandleMerger {
public:
    explicit CandleMerger(domain::SeriesKey key);

    // Rows at or before existing_tail are dropped (already committed). When two
    // rows share an open_time the later one in `incoming` wins.
    MergeResult merge(const std::optional<domain::Candle>& existing_tail,
                      const std::vector<domain::Candle>& incoming) const;

    const domain::SeriesKey& key() const noexcept { return key_; }

private:
    domain::SeriesKey key_;
};

}  // namespace tape::app
