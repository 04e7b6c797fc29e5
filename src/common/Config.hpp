#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace tape::common {

struct Config {
    tape::log::Level logLevel = tape::log::Level::Info;
    std::string storeRoot = "data/ohlcv";
    std::string exchange = "binance";
    std::string category = "spot";
    std::vector<std::string> symbols{"BTCUSDT"};
    std::vector<std::string> timeframes{"1m"};
    // Epoch milliseconds; toMs is exclusive.
    std::int64_t fromMs = 1'704'067'200'000;  // 2024-01-01
    std::int64_t toMs = 0;
    std::size_t threads = 1;
    std::size_t pageSize = 1000;
    std::size_t rateLimitRequests = 10;
    std::uint32_t rateLimitIntervalMs = 1000;
    std::size_t maxRetries = 5;
    std::uint32_t backoffBaseMs = 500;
    std::uint32_t backoffMaxMs = 30000;
    std::size_t maxRowsPerPartition = 100000;
    std::size_t maxGapRefetchAttempts = 3;
    std::size_t maxConsecutiveFailures = 5;
    bool status = false;
    // Print the exchange's instruments and exit.
    bool instruments = false;
    // Refuse to start when a requested symbol is not an active instrument.
    bool verifySymbols = false;

    static Config fromArgs(int argc, char** argv);
};

// "YYYY-MM-DD" (UTC midnight) or a non-negative epoch-ms integer.
std::int64_t parseTimestampArg(const std::string& value, const std::string& label);

// "now", "YYYY-MM-DD" (end of that UTC day, exclusive) or epoch ms.
std::int64_t parseEndTimestampArg(const std::string& value, const std::string& label);

}  // namespace tape::common
