#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "domain/Types.hpp"

namespace tape::common {
namespace {

constexpr std::int64_t kMsPerDay = 86'400'000;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> splitCommaList(const std::string& value) {
    std::vector<std::string> items;
    std::size_t begin = 0;
    while (begin <= value.size()) {
        const auto comma = std::min(value.find(',', begin), value.size());
        if (auto item = trim(value.substr(begin, comma - begin)); !item.empty()) {
            items.push_back(std::move(item));
        }
        begin = comma + 1;
    }
    return items;
}

std::vector<std::string> deduplicateList(std::vector<std::string> values) {
    std::vector<std::string> unique;
    unique.reserve(values.size());
    for (auto& value : values) {
        if (!value.empty() && std::find(unique.begin(), unique.end(), value) == unique.end()) {
            unique.push_back(std::move(value));
        }
    }
    return unique;
}

std::size_t parsePositive(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || parsed == 0U) {
            throw std::out_of_range("must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    const auto parsed = parsePositive(value, label);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

tape::log::Level parseLevel(const std::string& value, const std::string& label) {
    try {
        return tape::log::levelFromString(toLower(trim(value)));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string parseExchange(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "binance" || normalized == "bybit") {
        return normalized;
    }
    throw std::runtime_error("Unsupported exchange: " + value);
}

std::string parseCategory(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "spot" || normalized == "linear" || normalized == "inverse") {
        return normalized;
    }
    throw std::runtime_error("Unsupported category: " + value);
}

// Accepts "--key value" and "--key=value"; the last occurrence wins.
class CommandLine {
public:
    CommandLine(int argc, char** argv) : args_(argv + std::min(argc, 1), argv + std::max(argc, 0)) {}

    std::string value(const std::string& key) const {
        std::string found;
        for (std::size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];
            if (arg == key && i + 1 < args_.size()) {
                found = args_[++i];
            } else if (arg.size() > key.size() && arg.compare(0, key.size(), key) == 0 && arg[key.size()] == '=') {
                found = arg.substr(key.size() + 1);
            }
        }
        return found;
    }

    bool has(const std::string& key) const { return std::find(args_.begin(), args_.end(), key) != args_.end(); }

private:
    std::vector<std::string> args_;
};

bool isDigits(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::int64_t nowMs() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

}  // namespace

std::int64_t parseTimestampArg(const std::string& value, const std::string& label) {
    const auto text = trim(value);
    if (isDigits(text)) {
        try {
            return static_cast<std::int64_t>(std::stoll(text));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid value for " + label + ": " + value);
        }
    }

    std::tm tm{};
    std::istringstream input(text);
    input >> std::get_time(&tm, "%Y-%m-%d");
    if (input.fail() || input.peek() != std::char_traits<char>::eof()) {
        throw std::runtime_error("Invalid value for " + label + " (expected YYYY-MM-DD or epoch ms): " + value);
    }
    tm.tm_isdst = 0;
    const auto raw = timegm(&tm);
    if (raw < 0) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<std::int64_t>(raw) * 1000;
}

std::int64_t parseEndTimestampArg(const std::string& value, const std::string& label) {
    const auto text = trim(value);
    if (toLower(text) == "now") {
        return nowMs();
    }
    if (isDigits(text)) {
        return parseTimestampArg(text, label);
    }
    return parseTimestampArg(text, label) + kMsPerDay;
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};
    const CommandLine args(argc, argv);
    config.toMs = nowMs();

    if (const char* envRoot = std::getenv("TAPE_STORE_ROOT")) {
        auto rootValue = trim(envRoot);
        if (!rootValue.empty()) {
            config.storeRoot = std::move(rootValue);
        }
    }
    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLevel(envLogLevel, "LOG_LEVEL");
    }
    if (const char* envExchange = std::getenv("TAPE_EXCHANGE")) {
        config.exchange = parseExchange(envExchange);
    }

    if (auto rootArg = args.value("--root"); !rootArg.empty()) {
        config.storeRoot = trim(rootArg);
    }
    if (auto levelArg = args.value("--log-level"); !levelArg.empty()) {
        config.logLevel = parseLevel(levelArg, "--log-level");
    }
    if (auto exchangeArg = args.value("--exchange"); !exchangeArg.empty()) {
        config.exchange = parseExchange(exchangeArg);
    }
    if (auto categoryArg = args.value("--category"); !categoryArg.empty()) {
        config.category = parseCategory(categoryArg);
    }
    if (auto symbolsArg = args.value("--symbols"); !symbolsArg.empty()) {
        auto list = splitCommaList(symbolsArg);
        if (!list.empty()) {
            config.symbols = std::move(list);
        }
    }
    if (auto timeframesArg = args.value("--timeframes"); !timeframesArg.empty()) {
        auto list = splitCommaList(timeframesArg);
        if (!list.empty()) {
            config.timeframes = std::move(list);
        }
    }
    if (auto fromArg = args.value("--from"); !fromArg.empty()) {
        config.fromMs = parseTimestampArg(fromArg, "--from");
    }
    if (auto toArg = args.value("--to"); !toArg.empty()) {
        config.toMs = parseEndTimestampArg(toArg, "--to");
    }
    if (auto threadsArg = args.value("--threads"); !threadsArg.empty()) {
        config.threads = parsePositive(threadsArg, "--threads");
    }
    if (auto pageArg = args.value("--page-size"); !pageArg.empty()) {
        config.pageSize = parsePositive(pageArg, "--page-size");
    }
    if (auto requestsArg = args.value("--rate-limit-requests"); !requestsArg.empty()) {
        config.rateLimitRequests = parsePositive(requestsArg, "--rate-limit-requests");
    }
    if (auto intervalArg = args.value("--rate-limit-interval-ms"); !intervalArg.empty()) {
        config.rateLimitIntervalMs = parseDurationMs(intervalArg, "--rate-limit-interval-ms");
    }
    if (auto retriesArg = args.value("--max-retries"); !retriesArg.empty()) {
        config.maxRetries = parsePositive(retriesArg, "--max-retries");
    }
    if (auto baseArg = args.value("--backoff-base-ms"); !baseArg.empty()) {
        config.backoffBaseMs = parseDurationMs(baseArg, "--backoff-base-ms");
    }
    if (auto maxArg = args.value("--backoff-max-ms"); !maxArg.empty()) {
        config.backoffMaxMs = parseDurationMs(maxArg, "--backoff-max-ms");
    }
    if (auto rowsArg = args.value("--max-rows-per-partition"); !rowsArg.empty()) {
        config.maxRowsPerPartition = parsePositive(rowsArg, "--max-rows-per-partition");
    }
    if (auto gapArg = args.value("--max-gap-refetches"); !gapArg.empty()) {
        config.maxGapRefetchAttempts = parsePositive(gapArg, "--max-gap-refetches");
    }
    if (auto failuresArg = args.value("--max-consecutive-failures"); !failuresArg.empty()) {
        config.maxConsecutiveFailures = parsePositive(failuresArg, "--max-consecutive-failures");
    }
    if (args.has("--instruments")) {
        config.instruments = true;
    }
    if (args.has("--verify-symbols")) {
        config.verifySymbols = true;
    }
    if (args.has("--status")) {
        config.status = true;
    }

    for (auto& symbol : config.symbols) {
        symbol = domain::normalize_symbol(symbol);
        if (symbol.empty()) {
            throw std::runtime_error("Empty symbol in --symbols");
        }
    }
    config.symbols = deduplicateList(std::move(config.symbols));

    for (auto& label : config.timeframes) {
        try {
            label = domain::timeframe_label(domain::timeframe_from_label(label));
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("Unsupported timeframe: " + label);
        }
    }
    config.timeframes = deduplicateList(std::move(config.timeframes));

    if (config.fromMs >= config.toMs) {
        throw std::runtime_error("--from (" + std::to_string(config.fromMs) + ") must be before --to (" +
                                 std::to_string(config.toMs) + ")");
    }
    if (config.backoffBaseMs > config.backoffMaxMs) {
        config.backoffMaxMs = config.backoffBaseMs;
    }
    if (config.storeRoot.empty()) {
        throw std::runtime_error("Store root must not be empty");
    }

    std::error_code ec;
    std::filesystem::create_directories(config.storeRoot, ec);
    if (ec) {
        throw std::runtime_error("Unable to create store root (" + config.storeRoot + "): " + ec.message());
    }

    return config;
}

}  // namespace tape::common
