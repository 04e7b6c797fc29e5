#include "adapters/parquet/DurableFile.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tape::adapters::parquet {
namespace {

std::runtime_error makeError(const std::string& what, const fs::path& path, int err) {
    return std::runtime_error(what + " '" + path.string() + "': " + std::strerror(err));
}

void syncPath(const fs::path& path, int flags, const char* what) {
    const int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw makeError(std::string{"unable to open for "} + what, path, errno);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        throw makeError(std::string{"fsync failed for "} + what, path, err);
    }
    ::close(fd);
}

}  // namespace

void sync_file(const fs::path& path) {
    syncPath(path, O_RDONLY, "file");
}

void sync_directory(const fs::path& dir) {
    syncPath(dir.empty() ? fs::path{"."} : dir, O_RDONLY | O_DIRECTORY, "directory");
}

void publish_file(const fs::path& tmp, const fs::path& target) {
    sync_file(tmp);
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        throw std::runtime_error("unable to rename '" + tmp.string() + "' to '" + target.string() +
                                 "': " + ec.message());
    }
    sync_directory(target.parent_path());
}

void write_file_atomic(const fs::path& target, const std::string& content) {
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out) {
            throw std::runtime_error("unable to create '" + tmp.string() + "'");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("unable to write '" + tmp.string() + "'");
        }
    }
    publish_file(tmp, target);
}

}  // namespace tape::adapters::parquet
