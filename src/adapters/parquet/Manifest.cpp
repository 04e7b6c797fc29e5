#include "adapters/parquet/Manifest.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <boost/json.hpp>

#include "adapters/parquet/DurableFile.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;

namespace tape::adapters::parquet {
namespace {

[[noreturn]] void corrupt(const fs::path& path, const std::string& message) {
    throw domain::CorruptPartitionError("Manifest " + path.string() + ": " + message);
}

std::int64_t readInt(const json::object& obj, const char* field, const fs::path& path) {
    const auto* value = obj.if_contains(field);
    if (value == nullptr || !value->is_int64()) {
        if (value != nullptr && value->is_uint64()) {
            return static_cast<std::int64_t>(value->as_uint64());
        }
        corrupt(path, std::string{"field '"} + field + "' missing or not an integer");
    }
    return value->as_int64();
}

void checkConsistency(const Manifest& manifest, const fs::path& path) {
    const auto step = manifest.key.timeframe.ms;
    for (std::size_t i = 0; i < manifest.partitions.size(); ++i) {
        const auto& entry = manifest.partitions[i];
        if (entry.last < entry.first || (entry.last - entry.first) % step != 0) {
            corrupt(path, "partition " + entry.file + " has invalid bounds");
        }
        const auto expectedRows = static_cast<std::size_t>((entry.last - entry.first) / step + 1);
        if (entry.rows != expectedRows) {
            corrupt(path, "partition " + entry.file + " row count does not match its bounds");
        }
        if (entry.file != partition_file_name(entry.first)) {
            corrupt(path, "partition file name " + entry.file + " does not match its first open_time");
        }
        if (i > 0 && entry.first != manifest.partitions[i - 1].last + step) {
            corrupt(path, "partition " + entry.file + " does not continue its predecessor");
        }
        if (i + 1 < manifest.partitions.size() && !entry.sealed) {
            corrupt(path, "partition " + entry.file + " is followed by another but not sealed");
        }
    }

    const std::optional<domain::TimestampMs> expected =
        manifest.partitions.empty() ? std::nullopt : std::optional<domain::TimestampMs>{manifest.partitions.back().last};
    if (manifest.watermark != expected) {
        corrupt(path, "watermark disagrees with the partition list");
    }
}

}  // namespace

std::size_t Manifest::totalRows() const noexcept {
    std::size_t rows = 0;
    for (const auto& entry : partitions) {
        rows += entry.rows;
    }
    return rows;
}

std::string partition_file_name(domain::TimestampMs first) {
    return "p_" + std::to_string(first) + ".parquet";
}

Manifest load_manifest(const fs::path& path, const domain::SeriesKey& key) {
    Manifest manifest;
    manifest.key = key;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return manifest;
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        corrupt(path, "unreadable");
    }
    const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    json::error_code parseError;
    const auto root = json::parse(text, parseError);
    if (parseError || !root.is_object()) {
        corrupt(path, "not a JSON object");
    }
    const auto& obj = root.as_object();

    if (readInt(obj, "version", path) != Manifest::kVersion) {
        corrupt(path, "unsupported version");
    }
    const auto* symbol = obj.if_contains("symbol");
    const auto* timeframe = obj.if_contains("timeframe");
    if (symbol == nullptr || !symbol->is_string() || timeframe == nullptr || !timeframe->is_string() ||
        std::string{symbol->as_string().c_str()} != key.symbol ||
        std::string{timeframe->as_string().c_str()} != domain::timeframe_label(key.timeframe)) {
        corrupt(path, "series identity does not match " + key.to_string());
    }

    if (const auto* watermark = obj.if_contains("watermark"); watermark != nullptr && !watermark->is_null()) {
        manifest.watermark = readInt(obj, "watermark", path);
    }

    const auto* partitions = obj.if_contains("partitions");
    if (partitions == nullptr || !partitions->is_array()) {
        corrupt(path, "missing partition list");
    }
    for (const auto& value : partitions->as_array()) {
        if (!value.is_object()) {
            corrupt(path, "partition entry is not an object");
        }
        const auto& entryObj = value.as_object();
        PartitionEntry entry;
        const auto* file = entryObj.if_contains("file");
        if (file == nullptr || !file->is_string()) {
            corrupt(path, "partition entry without file");
        }
        entry.file = file->as_string().c_str();
        entry.first = readInt(entryObj, "first", path);
        entry.last = readInt(entryObj, "last", path);
        const auto rows = readInt(entryObj, "rows", path);
        if (rows <= 0) {
            corrupt(path, "partition " + entry.file + " is empty");
        }
        entry.rows = static_cast<std::size_t>(rows);
        const auto* sealed = entryObj.if_contains("sealed");
        entry.sealed = sealed != nullptr && sealed->is_bool() && sealed->as_bool();
        manifest.partitions.push_back(std::move(entry));
    }

    checkConsistency(manifest, path);
    return manifest;
}

std::string serialize_manifest(const Manifest& manifest) {
    json::object root;
    root["version"] = Manifest::kVersion;
    root["symbol"] = manifest.key.symbol;
    root["timeframe"] = domain::timeframe_label(manifest.key.timeframe);
    if (manifest.watermark) {
        root["watermark"] = *manifest.watermark;
    } else {
        root["watermark"] = nullptr;
    }

    json::array partitions;
    partitions.reserve(manifest.partitions.size());
    for (const auto& entry : manifest.partitions) {
        json::object item;
        item["file"] = entry.file;
        item["first"] = entry.first;
        item["last"] = entry.last;
        item["rows"] = static_cast<std::int64_t>(entry.rows);
        item["sealed"] = entry.sealed;
        partitions.push_back(std::move(item));
    }
    root["partitions"] = std::move(partitions);
    return json::serialize(root);
}

void save_manifest(const fs::path& path, const Manifest& manifest) {
    write_file_atomic(path, serialize_manifest(manifest));
}

}  // namespace tape::adapters::parquet
