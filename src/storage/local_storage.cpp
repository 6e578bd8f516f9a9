#include "uploadguard/storage/local_storage.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace uploadguard::storage {

namespace {

core::Error IoError(const std::string& what, const std::string& path, const std::string& detail) {
    return core::Error{core::ErrorCode::kStorageIo, what + " " + path + ": " + detail};
}

}  // namespace

FileWriter::~FileWriter() { Abandon(); }

core::Result<void> FileWriter::Open(const std::string& path) {
    if (is_open()) {
        return core::Error{core::ErrorCode::kInternal, "writer already open"};
    }
    bytes_written_ = 0;
#ifdef _WIN32
    if (std::filesystem::exists(path)) {
        return IoError("failed to create", path, "file exists");
    }
    stream_.open(path, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        return IoError("failed to create", path, "open failed");
    }
#else
    // O_EXCL: a generated name that already exists is never overwritten.
    fd_ = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd_ < 0) {
        return IoError("failed to create", path, std::strerror(errno));
    }
#endif
    return core::Ok();
}

core::Result<void> FileWriter::Write(const char* data, std::size_t size) {
    if (!is_open()) {
        return core::Error{core::ErrorCode::kInternal, "writer not open"};
    }
#ifdef _WIN32
    stream_.write(data, static_cast<std::streamsize>(size));
    if (!stream_) {
        return core::Error{core::ErrorCode::kStorageIo, "failed to write upload file"};
    }
#else
    std::size_t offset = 0;
    while (offset < size) {
        const ssize_t written = ::write(fd_, data + offset, size - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return core::Error{core::ErrorCode::kStorageIo,
                               std::string("failed to write upload file: ") +
                                   std::strerror(errno)};
        }
        offset += static_cast<std::size_t>(written);
    }
#endif
    bytes_written_ += static_cast<std::uint64_t>(size);
    return core::Ok();
}

core::Result<void> FileWriter::Close() {
    if (!is_open()) {
        return core::Ok();
    }
#ifdef _WIN32
    stream_.flush();
    const bool failed = !stream_;
    stream_.close();
    if (failed) {
        return core::Error{core::ErrorCode::kStorageIo, "failed to flush upload file"};
    }
#else
    const int sync_rc = ::fsync(fd_);
    const int sync_errno = errno;
    const int close_rc = ::close(fd_);
    fd_ = -1;
    if (sync_rc != 0) {
        return core::Error{core::ErrorCode::kStorageIo,
                           std::string("failed to sync upload file: ") + std::strerror(sync_errno)};
    }
    if (close_rc != 0) {
        return core::Error{core::ErrorCode::kStorageIo,
                           std::string("failed to close upload file: ") + std::strerror(errno)};
    }
#endif
    return core::Ok();
}

void FileWriter::Abandon() {
#ifdef _WIN32
    if (stream_.is_open()) {
        stream_.close();
    }
#else
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
#endif
}

bool FileWriter::is_open() const {
#ifdef _WIN32
    return stream_.is_open();
#else
    return fd_ >= 0;
#endif
}

core::Result<void> EnsureDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    // Concurrent uploads may race to create the same directory.
    std::error_code dir_ec;
    if (ec && !std::filesystem::is_directory(path, dir_ec)) {
        return IoError("failed to create directory", path, ec.message());
    }
    return core::Ok();
}

core::Result<std::vector<unsigned char>> ReadLeadingBytes(const std::string& path,
                                                          std::size_t count) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return IoError("failed to open", path, "open failed");
    }
    std::vector<unsigned char> bytes(count);
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(count));
    if (in.bad()) {
        return IoError("failed to read", path, "read failed");
    }
    bytes.resize(static_cast<std::size_t>(in.gcount()));
    return bytes;
}

core::Result<std::uint64_t> FileSize(const std::string& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return IoError("failed to stat", path, ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

core::Result<void> RemoveFile(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return IoError("failed to remove", path, ec.message());
    }
    return core::Ok();
}

core::Result<void> MoveFile(const std::string& from, const std::string& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        return IoError("failed to move", from, ec.message());
    }
    return core::Ok();
}

}  // namespace uploadguard::storage
