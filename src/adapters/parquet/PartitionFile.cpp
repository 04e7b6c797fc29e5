#include "adapters/parquet/PartitionFile.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace tape::adapters::parquet {
namespace {

struct ColumnSpec {
    std::string_view name;
    std::string_view type;
};

constexpr std::array<ColumnSpec, 6> kSchema{{
    {"open_time", "BIGINT"},
    {"open", "DOUBLE"},
    {"high", "DOUBLE"},
    {"low", "DOUBLE"},
    {"close", "DOUBLE"},
    {"volume", "DOUBLE"},
}};

constexpr auto kCreateStaging = R"SQL(
    CREATE TABLE staging (
        open_time BIGINT,
        "open" DOUBLE,
        high DOUBLE,
        low DOUBLE,
        "close" DOUBLE,
        volume DOUBLE
    )
)SQL";

constexpr auto kColumns = R"(open_time, "open", high, low, "close", volume)";

std::string quoteLiteral(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

std::string readParquet(const fs::path& file) {
    return "read_parquet(" + quoteLiteral(file.string()) + ")";
}

}  // namespace

PartitionFile::PartitionFile()
    : db_(std::make_unique<::duckdb::DuckDB>(nullptr)),
      connection_(std::make_unique<::duckdb::Connection>(*db_)) {}

PartitionFile::~PartitionFile() = default;

void PartitionFile::stage(const std::vector<domain::Candle>& batch) {
    if (staged_) {
        auto dropped = connection_->Query("DROP TABLE staging");
        if (!dropped || dropped->HasError()) {
            throw std::runtime_error("PartitionFile: unable to reset staging: " +
                                     (dropped ? dropped->GetError() : std::string{"unknown error"}));
        }
        staged_ = false;
    }

    auto created = connection_->Query(kCreateStaging);
    if (!created || created->HasError()) {
        throw std::runtime_error("PartitionFile: unable to create staging table: " +
                                 (created ? created->GetError() : std::string{"unknown error"}));
    }
    staged_ = true;

    try {
        ::duckdb::Appender appender(*connection_, "staging");
        for (const auto& candle : batch) {
            appender.BeginRow();
            appender.Append<int64_t>(candle.openTime);
            appender.Append<double>(candle.open);
            appender.Append<double>(candle.high);
            appender.Append<double>(candle.low);
            appender.Append<double>(candle.close);
            appender.Append<double>(candle.volume);
            appender.EndRow();
        }
        appender.Close();
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"PartitionFile: staging append failed: "} + ex.what());
    }
}

void PartitionFile::write(const fs::path& target,
                          const std::optional<ExistingRows>& existing,
                          domain::TimestampMs from,
                          domain::TimestampMs to) {
    if (!staged_) {
        throw std::logic_error("PartitionFile::write called before stage()");
    }

    std::string select = std::string{"SELECT "} + kColumns + " FROM staging WHERE open_time >= " +
                         std::to_string(from) + " AND open_time <= " + std::to_string(to);
    if (existing) {
        checkSchema(existing->file);
        select = std::string{"SELECT "} + kColumns + " FROM " + readParquet(existing->file) +
                 " WHERE open_time <= " + std::to_string(existing->upTo) + " UNION ALL " + select;
    }

    const std::string copy = "COPY (SELECT * FROM (" + select + ") ORDER BY open_time) TO " +
                             quoteLiteral(target.string()) + " (FORMAT PARQUET, COMPRESSION ZSTD)";

    auto result = connection_->Query(copy);
    if (!result || result->HasError()) {
        throw std::runtime_error("PartitionFile: writing " + target.string() + " failed: " +
                                 (result ? result->GetError() : std::string{"unknown error"}));
    }
}

void PartitionFile::checkSchema(const fs::path& file) {
    auto result = connection_->Query("DESCRIBE SELECT * FROM " + readParquet(file));
    if (!result || result->HasError()) {
        throw domain::CorruptPartitionError("Partition " + file.string() + " unreadable: " +
                                            (result ? result->GetError() : std::string{"unknown error"}));
    }

    std::size_t index = 0;
    while (auto chunk = result->Fetch()) {
        for (::duckdb::idx_t row = 0; row < chunk->size(); ++row, ++index) {
            if (index >= kSchema.size()) {
                throw domain::CorruptPartitionError("Partition " + file.string() + " has extra columns");
            }
            const auto name = chunk->GetValue(0, row).ToString();
            const auto type = chunk->GetValue(1, row).ToString();
            if (name != kSchema[index].name || type != kSchema[index].type) {
                throw domain::CorruptPartitionError("Partition " + file.string() + " column " +
                                                    std::to_string(index) + " is " + name + ":" + type +
                                                    ", expected " + std::string{kSchema[index].name} + ":" +
                                                    std::string{kSchema[index].type});
            }
        }
    }
    if (index != kSchema.size()) {
        throw domain::CorruptPartitionError("Partition " + file.string() + " is missing columns");
    }
}

std::vector<domain::Candle> PartitionFile::read(const fs::path& file,
                                                const domain::SeriesKey& key,
                                                domain::TimestampMs from,
                                                domain::TimestampMs to) {
    checkSchema(file);

    const std::string query = std::string{"SELECT "} + kColumns + " FROM " + readParquet(file) +
                              " WHERE open_time >= " + std::to_string(from) + " AND open_time <= " +
                              std::to_string(to);
    auto result = connection_->Query(query);
    if (!result || result->HasError()) {
        throw domain::CorruptPartitionError("Partition " + file.string() + " unreadable: " +
                                            (result ? result->GetError() : std::string{"unknown error"}));
    }

    std::vector<domain::Candle> rows;
    while (auto chunk = result->Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::Candle candle{};
            candle.symbol = key.symbol;
            candle.timeframe = key.timeframe;
            for (::duckdb::idx_t column = 0; column < kSchema.size(); ++column) {
                if (chunk->GetValue(column, row).IsNull()) {
                    throw domain::CorruptPartitionError("Partition " + file.string() + " contains NULL values");
                }
            }
            candle.openTime = chunk->GetValue(0, row).GetValue<int64_t>();
            candle.open = chunk->GetValue(1, row).GetValue<double>();
            candle.high = chunk->GetValue(2, row).GetValue<double>();
            candle.low = chunk->GetValue(3, row).GetValue<double>();
            candle.close = chunk->GetValue(4, row).GetValue<double>();
            candle.volume = chunk->GetValue(5, row).GetValue<double>();
            rows.push_back(std::move(candle));
        }
    }

    LOG_DEBUG("PartitionFile read " << rows.size() << " rows from " << file.filename().string());
    return rows;
}

}  // namespace tape::adapters::parquet
