#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "uploadguard/core/error.h"
#include "uploadguard/core/result.h"

namespace uploadguard::storage {

/// @brief Exclusive-create file writer; the file is closed (not removed) on destruction.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    /// @brief Creates `path`; fails if it already exists.
    core::Result<void> Open(const std::string& path);
    core::Result<void> Write(const char* data, std::size_t size);
    /// @brief Flushes to stable storage and closes.
    core::Result<void> Close();
    /// @brief Closes without flushing; for files about to be deleted.
    void Abandon();

    bool is_open() const;
    std::uint64_t bytes_written() const { return bytes_written_; }

private:
#ifdef _WIN32
    std::ofstream stream_;
#else
    int fd_{-1};
#endif
    std::uint64_t bytes_written_{0};
};

core::Result<void> EnsureDirectory(const std::string& path);
/// @brief Reads up to `count` bytes from the start of the file.
core::Result<std::vector<unsigned char>> ReadLeadingBytes(const std::string& path,
                                                          std::size_t count);
core::Result<std::uint64_t> FileSize(const std::string& path);
/// @brief Removes a file; a file that is already gone counts as success.
core::Result<void> RemoveFile(const std::string& path);
/// @brief Atomically moves a closed file into place.
core::Result<void> MoveFile(const std::string& from, const std::string& to);

}  // namespace uploadguard::storage
