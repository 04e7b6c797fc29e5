#include "app/CandleMerger.hpp"

#include <map>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace tape::app {

CandleMerger::CandleMerger(domain::SeriesKey key) : key_(std::move(key)) {
    if (key_.symbol.empty() || !key_.timeframe.valid()) {
        throw std::invalid_argument("CandleMerger requires a symbol and a valid timeframe");
    }
}

MergeResult CandleMerger::merge(const std::optional<domain::Candle>& existing_tail,
                                const std::vector<domain::Candle>& incoming) const {
    MergeResult result;
    const auto step = key_.timeframe.ms;

    std::map<domain::TimestampMs, domain::Candle> byTime;
    for (const auto& raw : incoming) {
        try {
            if (raw.symbol != key_.symbol || raw.timeframe != key_.timeframe) {
                throw domain::ValidationError("row for " + raw.symbol + "/" +
                                              domain::timeframe_label(raw.timeframe) + " merged into " +
                                              key_.to_string());
            }
            domain::validate_candle(raw);
        } catch (const domain::ValidationError& ex) {
            ++result.rejected;
            LOG_WARN("CandleMerger " << key_.to_string() << " dropping row: " << ex.what());
            continue;
        }

        if (existing_tail && raw.openTime <= existing_tail->openTime) {
            continue;
        }

        auto [it, inserted] = byTime.emplace(raw.openTime, raw);
        if (!inserted) {
            ++result.duplicates;
            if (!domain::same_values(it->second, raw)) {
                LOG_DEBUG("CandleMerger " << key_.to_string() << " correction at " << raw.openTime
                                          << " close " << it->second.close << " -> " << raw.close);
            }
            it->second = raw;
        }
    }

    result.clean_batch.reserve(byTime.size());
    std::optional<domain::TimestampMs> previous;
    if (existing_tail) {
        previous = existing_tail->openTime;
    }
    for (auto& [openTime, candle] : byTime) {
        if (previous && openTime - *previous > step) {
            result.gaps.push_back(domain::TimeRange{*previous + step, openTime});
        }
        previous = openTime;
        result.clean_batch.push_back(std::move(candle));
    }

    if (!result.gaps.empty()) {
        LOG_INFO("CandleMerger " << key_.to_string() << " found " << result.gaps.size()
                                 << " gap(s), first [" << result.gaps.front().start << ", "
                                 << result.gaps.front().end << ")");
    }
    return result;
}

}  // namespace tape::app
