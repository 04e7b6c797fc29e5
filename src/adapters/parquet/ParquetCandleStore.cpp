#include "adapters/parquet/ParquetCandleStore.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "adapters/parquet/DurableFile.hpp"
#include "adapters/parquet/PartitionFile.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace tape::adapters::parquet {
namespace {

constexpr const char* kManifestName = "manifest.json";

bool isValidSymbol(const std::string& symbol) {
    return !symbol.empty() && std::all_of(symbol.begin(), symbol.end(), [](unsigned char ch) {
        return std::isupper(ch) != 0 || std::isdigit(ch) != 0;
    });
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct PlannedWrite {
    std::size_t entryIndex{0};
    domain::TimestampMs from{0};
    domain::TimestampMs to{0};
    std::optional<ExistingRows> existing;
};

}  // namespace

std::int64_t partition_period(domain::TimestampMs openTime, domain::Timeframe timeframe) {
    const std::time_t seconds = static_cast<std::time_t>(domain::align_down(openTime, domain::Timeframe{1000}) / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    const std::int64_t year = static_cast<std::int64_t>(tm.tm_year) + 1900;
    if (timeframe.ms < domain::timeframes::kOneHour.ms) {
        return year * 12 + tm.tm_mon;
    }
    return year;
}

// ---------------------------------------------------------------------------
// CandleCursor

CandleCursor::CandleCursor(domain::SeriesKey key,
                           fs::path seriesDir,
                           std::vector<PartitionEntry> partitions,
                           domain::TimestampMs start,
                           domain::TimestampMs end)
    : key_(std::move(key)),
      seriesDir_(std::move(seriesDir)),
      partitions_(std::move(partitions)),
      start_(start),
      end_(end) {}

CandleCursor::CandleCursor(CandleCursor&&) noexcept = default;
CandleCursor& CandleCursor::operator=(CandleCursor&&) noexcept = default;
CandleCursor::~CandleCursor() = default;

std::optional<domain::Candle> CandleCursor::next() {
    while (position_ >= buffer_.size()) {
        if (nextPartition_ >= partitions_.size()) {
            return std::nullopt;
        }
        loadNextPartition();
    }
    return buffer_[position_++];
}

void CandleCursor::reset() {
    nextPartition_ = 0;
    buffer_.clear();
    position_ = 0;
}

void CandleCursor::loadNextPartition() {
    const auto& entry = partitions_[nextPartition_++];
    buffer_.clear();
    position_ = 0;

    const auto step = key_.timeframe.ms;
    const auto from = std::max(entry.first, domain::align_up(start_, key_.timeframe));
    const auto to = std::min(entry.last, domain::align_down(end_ - 1, key_.timeframe));
    if (from > to) {
        return;
    }

    if (!io_) {
        io_ = std::make_unique<PartitionFile>();
    }
    const auto file = seriesDir_ / entry.file;
    auto rows = io_->read(file, key_, from, to);

    const auto expected = static_cast<std::size_t>((to - from) / step + 1);
    if (rows.size() != expected) {
        throw domain::CorruptPartitionError("Partition " + file.string() + " holds " + std::to_string(rows.size()) +
                                            " rows in [" + std::to_string(from) + ", " + std::to_string(to) +
                                            "], expected " + std::to_string(expected));
    }
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto want = from + static_cast<domain::TimestampMs>(i) * step;
        if (rows[i].openTime != want) {
            throw domain::CorruptPartitionError("Partition " + file.string() + " is out of order at row " +
                                                std::to_string(i) + ": open_time " +
                                                std::to_string(rows[i].openTime) + ", expected " +
                                                std::to_string(want));
        }
    }
    buffer_ = std::move(rows);
}

// ---------------------------------------------------------------------------
// ParquetCandleStore

ParquetCandleStore::ParquetCandleStore(StoreOptions options) : options_(std::move(options)) {
    if (options_.root.empty()) {
        throw std::invalid_argument("ParquetCandleStore requires a root directory");
    }
    if (options_.maxRowsPerPartition == 0U) {
        throw std::invalid_argument("maxRowsPerPartition must be at least 1");
    }
    std::error_code ec;
    fs::create_directories(options_.root, ec);
    if (ec) {
        throw std::runtime_error("ParquetCandleStore: unable to create root '" + options_.root.string() +
                                 "': " + ec.message());
    }
}

domain::SeriesKey ParquetCandleStore::makeKey(const domain::Symbol& symbol, domain::Timeframe timeframe) const {
    domain::SeriesKey key{domain::normalize_symbol(symbol), timeframe};
    if (!isValidSymbol(key.symbol)) {
        throw std::invalid_argument("Invalid symbol for storage: '" + symbol + "'");
    }
    if (domain::timeframe_label(timeframe).empty()) {
        throw std::invalid_argument("Unsupported timeframe for storage: " + std::to_string(timeframe.ms) + " ms");
    }
    return key;
}

fs::path ParquetCandleStore::seriesDir(const domain::SeriesKey& key) const {
    return options_.root / key.symbol / domain::timeframe_label(key.timeframe);
}

Manifest ParquetCandleStore::loadManifest(const domain::SeriesKey& key) const {
    return load_manifest(seriesDir(key) / kManifestName, key);
}

void ParquetCandleStore::notify(const domain::SeriesKey& key, CommitPhase phase) const {
    if (options_.commitObserver) {
        options_.commitObserver(key, phase);
    }
}

void ParquetCandleStore::recover(const domain::SeriesKey& key, const Manifest& manifest) const {
    const auto dir = seriesDir(key);
    std::error_code ec;
    for (const auto& item : fs::directory_iterator(dir, ec)) {
        if (!item.is_regular_file()) {
            continue;
        }
        const auto name = item.path().filename().string();
        bool remove = endsWith(name, ".tmp");
        if (!remove && name.rfind("p_", 0) == 0 && endsWith(name, ".parquet")) {
            remove = std::none_of(manifest.partitions.begin(), manifest.partitions.end(),
                                  [&name](const PartitionEntry& entry) { return entry.file == name; });
        }
        if (!remove) {
            continue;
        }
        std::error_code removeError;
        fs::remove(item.path(), removeError);
        if (removeError) {
            throw std::runtime_error("Recovery of " + key.to_string() + " could not remove '" +
                                     item.path().string() + "': " + removeError.message());
        }
        LOG_WARN("Recovery of " << key.to_string() << " discarded uncommitted file " << name);
    }
    if (ec) {
        throw std::runtime_error("Recovery of " + key.to_string() + " could not list '" + dir.string() +
                                 "': " + ec.message());
    }
}

WriterLease ParquetCandleStore::open_writer(const domain::Symbol& symbol, domain::Timeframe timeframe) {
    const auto key = makeKey(symbol, timeframe);
    auto lease = WriterLease::acquire(key, seriesDir(key));
    recover(key, loadManifest(key));
    return lease;
}

std::optional<domain::TimestampMs> ParquetCandleStore::append(const domain::Symbol& symbol,
                                                              domain::Timeframe timeframe,
                                                              const std::vector<domain::Candle>& batch) {
    auto lease = open_writer(symbol, timeframe);
    return append(lease, batch);
}

std::optional<domain::TimestampMs> ParquetCandleStore::append(WriterLease& lease,
                                                              const std::vector<domain::Candle>& batch) {
    if (!lease.held()) {
        throw std::logic_error("append requires a held writer lease");
    }
    const auto& key = lease.key();
    const auto dir = seriesDir(key);
    auto manifest = loadManifest(key);

    if (batch.empty()) {
        return manifest.watermark;
    }

    const auto step = key.timeframe.ms;
    if (manifest.watermark) {
        for (const auto& candle : batch) {
            if (candle.openTime <= *manifest.watermark) {
                throw domain::StaleWriteError("Append to " + key.to_string() + " at " +
                                              std::to_string(candle.openTime) + " is at or behind watermark " +
                                              std::to_string(*manifest.watermark));
            }
        }
        if (batch.front().openTime != *manifest.watermark + step) {
            throw std::invalid_argument("Append to " + key.to_string() + " starting at " +
                                        std::to_string(batch.front().openTime) +
                                        " would leave a gap after watermark " + std::to_string(*manifest.watermark));
        }
    }
    for (std::size_t i = 0; i < batch.size(); ++i) {
        const auto& candle = batch[i];
        if (candle.symbol != key.symbol || candle.timeframe != key.timeframe) {
            throw std::invalid_argument("Append to " + key.to_string() + " received a candle for " + candle.symbol +
                                        "/" + domain::timeframe_label(candle.timeframe));
        }
        domain::validate_candle(candle);
        if (i > 0 && candle.openTime != batch[i - 1].openTime + step) {
            throw std::invalid_argument("Append to " + key.to_string() + " is not contiguous at " +
                                        std::to_string(candle.openTime));
        }
    }

    Manifest next = manifest;
    std::vector<PlannedWrite> plan;
    std::size_t i = 0;
    while (i < batch.size()) {
        const auto period = partition_period(batch[i].openTime, key.timeframe);
        bool needsNew = next.partitions.empty() || next.partitions.back().sealed;
        if (!needsNew) {
            auto& open = next.partitions.back();
            if (partition_period(open.first, key.timeframe) != period ||
                open.rows >= options_.maxRowsPerPartition) {
                open.sealed = true;
                needsNew = true;
                LOG_INFO("Sealed partition " << open.file << " of " << key.to_string() << " rows=" << open.rows);
            }
        }
        if (needsNew) {
            PartitionEntry entry;
            entry.file = partition_file_name(batch[i].openTime);
            entry.first = batch[i].openTime;
            entry.last = batch[i].openTime - step;
            next.partitions.push_back(std::move(entry));
        }

        auto& open = next.partitions.back();
        PlannedWrite write;
        write.entryIndex = next.partitions.size() - 1;
        if (open.rows > 0) {
            write.existing = ExistingRows{dir / open.file, open.last};
        }

        std::size_t j = i;
        while (j < batch.size() && partition_period(batch[j].openTime, key.timeframe) == period &&
               open.rows + (j - i) < options_.maxRowsPerPartition) {
            ++j;
        }

        write.from = batch[i].openTime;
        write.to = batch[j - 1].openTime;
        open.last = write.to;
        open.rows += j - i;
        plan.push_back(std::move(write));
        i = j;
    }

    PartitionFile io;
    io.stage(batch);
    for (const auto& write : plan) {
        const auto target = dir / next.partitions[write.entryIndex].file;
        fs::path tmp = target;
        tmp += ".tmp";
        std::error_code ec;
        fs::remove(tmp, ec);
        io.write(tmp, write.existing, write.from, write.to);
        publish_file(tmp, target);
    }
    notify(key, CommitPhase::PartitionsVisible);

    next.watermark = batch.back().openTime;
    save_manifest(dir / kManifestName, next);
    notify(key, CommitPhase::ManifestVisible);

    LOG_DEBUG("Committed " << batch.size() << " candles to " << key.to_string() << " watermark=" << *next.watermark
                           << " partitions touched=" << plan.size());
    return next.watermark;
}

CandleCursor ParquetCandleStore::read_range(const domain::Symbol& symbol,
                                            domain::Timeframe timeframe,
                                            domain::TimestampMs start_time,
                                            domain::TimestampMs end_time) const {
    const auto key = makeKey(symbol, timeframe);
    const auto manifest = loadManifest(key);

    std::vector<PartitionEntry> selected;
    if (start_time < end_time) {
        for (const auto& entry : manifest.partitions) {
            if (entry.last >= start_time && entry.first < end_time) {
                selected.push_back(entry);
            }
        }
    }
    return CandleCursor(key, seriesDir(key), std::move(selected), start_time, end_time);
}

std::vector<domain::Candle> ParquetCandleStore::read_all(const domain::Symbol& symbol,
                                                         domain::Timeframe timeframe,
                                                         domain::TimestampMs start_time,
                                                         domain::TimestampMs end_time) const {
    auto cursor = read_range(symbol, timeframe, start_time, end_time);
    std::vector<domain::Candle> candles;
    while (auto candle = cursor.next()) {
        candles.push_back(std::move(*candle));
    }
    return candles;
}

std::optional<domain::TimestampMs> ParquetCandleStore::watermark(const domain::Symbol& symbol,
                                                                 domain::Timeframe timeframe) const {
    return loadManifest(makeKey(symbol, timeframe)).watermark;
}

std::optional<domain::Candle> ParquetCandleStore::tail(const domain::Symbol& symbol,
                                                       domain::Timeframe timeframe) const {
    const auto mark = watermark(symbol, timeframe);
    if (!mark) {
        return std::nullopt;
    }
    auto cursor = read_range(symbol, timeframe, *mark, *mark + timeframe.ms);
    auto candle = cursor.next();
    if (!candle) {
        throw domain::CorruptPartitionError("Watermark " + std::to_string(*mark) + " of " + symbol +
                                            " has no stored candle");
    }
    return candle;
}

domain::SeriesCoverage ParquetCandleStore::coverage(const domain::Symbol& symbol, domain::Timeframe timeframe) const {
    const auto key = makeKey(symbol, timeframe);
    const auto manifest = loadManifest(key);

    domain::SeriesCoverage result;
    result.key = key;
    if (!manifest.partitions.empty()) {
        result.first = manifest.partitions.front().first;
        result.last = manifest.watermark;
    }
    result.rows = manifest.totalRows();
    result.partitions = manifest.partitions.size();
    return result;
}

std::vector<domain::SeriesCoverage> ParquetCandleStore::list_series() const {
    std::vector<domain::SeriesCoverage> series;
    std::error_code ec;
    for (const auto& symbolDir : fs::directory_iterator(options_.root, ec)) {
        if (!symbolDir.is_directory()) {
            continue;
        }
        const auto symbol = symbolDir.path().filename().string();
        if (!isValidSymbol(symbol)) {
            continue;
        }
        std::error_code inner;
        for (const auto& timeframeDir : fs::directory_iterator(symbolDir.path(), inner)) {
            if (!timeframeDir.is_directory() || !fs::exists(timeframeDir.path() / kManifestName)) {
                continue;
            }
            domain::Timeframe timeframe{};
            try {
                timeframe = domain::timeframe_from_label(timeframeDir.path().filename().string());
            } catch (const std::invalid_argument&) {
                LOG_DEBUG("Skipping unknown timeframe directory " << timeframeDir.path().string());
                continue;
            }
            series.push_back(coverage(symbol, timeframe));
        }
    }
    if (ec) {
        throw std::runtime_error("Unable to list store root '" + options_.root.string() + "': " + ec.message());
    }
    std::sort(series.begin(), series.end(), [](const auto& lhs, const auto& rhs) { return lhs.key < rhs.key; });
    return series;
}

}  // namespace tape::adapters::parquet
