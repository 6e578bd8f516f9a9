#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "uploadguard/core/error.h"
#include "uploadguard/core/result.h"
#include "uploadguard/storage/local_storage.h"
#include "uploadguard/upload/category.h"
#include "uploadguard/upload/type_profile.h"

namespace uploadguard::upload {

/// @brief Validation states of one upload, in the order they are entered.
enum class PipelineStage {
    kReceived,
    kExtensionChecked,
    kMimeChecked,
    kStored,
    kSignatureChecked,
    kContentScanned,
    kAccepted,
    kRejected,
};

const char* StageName(PipelineStage stage);

/// @brief Caller-supplied description of a file part; the bytes arrive separately.
struct IncomingFile {
    std::string original_name;
    std::string declared_mime_type;
    /// Declared length when the transport knows it up front.
    std::optional<std::uint64_t> size_bytes;
};

/// @brief Descriptor of an accepted file, handed to the caller for metadata recording.
struct StoredFile {
    std::string storage_path;
    std::string storage_name;
    std::string original_name;
    std::uint64_t size_bytes{0};
    std::string declared_mime_type;
    UploadCategory category{UploadCategory::kImage};
    std::string created_at;
};

/// @brief Who is uploading; only used to correlate log lines.
struct UploadContext {
    std::string request_id;
    std::string user_id;
    std::string remote;
};

class IngestionPipeline;

/// @brief One in-flight upload that passed the metadata checks and owns a staging file.
///
/// The staging file is deleted on every path except a successful Commit(), including
/// destruction of an unfinished handle (aborted transfers leave nothing behind).
class PendingUpload {
    // Only the pipeline can mint one, so only the pipeline can construct an upload.
    struct PassKey {
        explicit PassKey() = default;
    };

public:
    PendingUpload(PassKey, std::shared_ptr<const TypeProfileRegistry> registry,
                  const TypeProfile* profile, IncomingFile file, UploadContext context,
                  std::string storage_name, std::string staging_path);
    ~PendingUpload();

    PendingUpload(const PendingUpload&) = delete;
    PendingUpload& operator=(const PendingUpload&) = delete;

    /// @brief Streams bytes to disk; exceeding the category limit rejects with kFileTooLarge.
    core::Result<void> Append(const char* data, std::size_t size);
    /// @brief Runs the byte-level checks and moves the file into its category directory.
    core::Result<StoredFile> Commit();
    /// @brief Discards the upload and its staging file.
    void Abort(const std::string& reason);

    PipelineStage stage() const { return stage_; }
    std::uint64_t bytes_received() const { return writer_.bytes_written(); }
    const std::string& storage_name() const { return storage_name_; }
    const std::string& staging_path() const { return staging_path_; }
    const TypeProfile& profile() const { return *profile_; }

private:
    friend class IngestionPipeline;

    core::Result<void> Open();
    core::Error Reject(core::Error error);
    void DiscardStagingFile();

    std::shared_ptr<const TypeProfileRegistry> registry_;
    const TypeProfile* profile_;
    IncomingFile file_;
    UploadContext context_;
    std::string storage_name_;
    std::string staging_path_;
    storage::FileWriter writer_;
    bool file_created_{false};
    PipelineStage stage_{PipelineStage::kMimeChecked};
};

/// @brief Validates uploads against their category profile and stores the survivors.
class IngestionPipeline {
public:
    explicit IngestionPipeline(std::shared_ptr<const TypeProfileRegistry> registry);

    /// @brief Filename, extension, declared MIME type and declared size; touches no disk.
    core::Result<void> ValidateMetadata(UploadCategory category, const IncomingFile& file) const;

    /// @brief Metadata checks, then opens a staging file under a generated name.
    core::Result<std::unique_ptr<PendingUpload>> Begin(UploadCategory category,
                                                       const IncomingFile& file,
                                                       const UploadContext& context = {}) const;

    /// @brief Whole pipeline over a readable stream.
    core::Result<StoredFile> Ingest(UploadCategory category, const IncomingFile& file,
                                    std::istream& data, const UploadContext& context = {}) const;

    const TypeProfileRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const TypeProfileRegistry> registry_;
};

/// @brief All-or-nothing group of uploads for one request.
///
/// Accepted files stay on disk only if the whole group succeeds and Release() is called;
/// the first rejection, or destruction before Release(), deletes everything accepted so far.
class UploadBatch {
public:
    UploadBatch(const IngestionPipeline& pipeline, UploadCategory category, std::size_t max_files,
                UploadContext context);
    ~UploadBatch();

    UploadBatch(const UploadBatch&) = delete;
    UploadBatch& operator=(const UploadBatch&) = delete;

    core::Result<StoredFile> Add(const IncomingFile& file, std::istream& data);
    /// @brief Fails the batch with an error the caller detected itself (e.g. a stray form field).
    core::Error Fail(const IncomingFile& file, core::Error error);
    /// @brief Hands the accepted files to the caller; the batch no longer owns them.
    std::vector<StoredFile> Release();

    std::size_t size() const { return accepted_.size(); }
    std::size_t max_files() const { return max_files_; }
    bool failed() const { return failed_; }

private:
    void Rollback();

    const IngestionPipeline& pipeline_;
    UploadCategory category_;
    std::size_t max_files_;
    UploadContext context_;
    std::vector<StoredFile> accepted_;
    std::size_t attempted_{0};
    bool failed_{false};
    bool released_{false};
};

}  // namespace uploadguard::upload
