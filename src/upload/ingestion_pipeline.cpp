#include "uploadguard/upload/ingestion_pipeline.h"

#include <array>
#include <filesystem>
#include <memory>

#include "uploadguard/core/logger.h"
#include "uploadguard/core/time.h"
#include "uploadguard/observability/metrics.h"
#include "uploadguard/upload/content_scanner.h"
#include "uploadguard/upload/filename_sanitizer.h"
#include "uploadguard/upload/secure_name.h"
#include "uploadguard/upload/signature_verifier.h"

namespace uploadguard::upload {

namespace {

constexpr std::size_t kChunkSize = 8192;

std::string JoinExtensions(const std::set<std::string>& extensions) {
    std::string joined;
    for (const auto& extension : extensions) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += extension;
    }
    return joined;
}

std::string SizeLimitMessage(std::uint64_t max_bytes) {
    return "File size exceeds maximum limit of " + std::to_string(max_bytes / kMiB) + "MB";
}

core::LogFields UploadFields(UploadCategory category, const IncomingFile& file,
                             const UploadContext& context) {
    return {{"category", CategoryName(category)},
            {"original_name", file.original_name},
            {"mime_type", file.declared_mime_type},
            {"request_id", context.request_id},
            {"user_id", context.user_id},
            {"remote", context.remote}};
}

// Metadata failures are detected before the named stage is entered.
PipelineStage StageOfMetadataFailure(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kUnsupportedMimeType:
            return PipelineStage::kExtensionChecked;
        case core::ErrorCode::kFileTooLarge:
            return PipelineStage::kMimeChecked;
        default:
            return PipelineStage::kReceived;
    }
}

void LogRejection(PipelineStage stage, const core::Error& error, core::LogFields fields) {
    fields.emplace_back("stage", StageName(stage));
    fields.emplace_back("error", core::ErrorCodeName(error.code));
    fields.emplace_back("message", error.message);
    core::LogWarningEvent("upload_rejected", fields);
    observability::RecordUploadRejected(error.code);
}

}  // namespace

const char* StageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::kReceived:
            return "received";
        case PipelineStage::kExtensionChecked:
            return "extension_checked";
        case PipelineStage::kMimeChecked:
            return "mime_checked";
        case PipelineStage::kStored:
            return "stored";
        case PipelineStage::kSignatureChecked:
            return "signature_checked";
        case PipelineStage::kContentScanned:
            return "content_scanned";
        case PipelineStage::kAccepted:
            return "accepted";
        case PipelineStage::kRejected:
            return "rejected";
    }
    return "unknown";
}

PendingUpload::PendingUpload(PassKey, std::shared_ptr<const TypeProfileRegistry> registry,
                             const TypeProfile* profile, IncomingFile file, UploadContext context,
                             std::string storage_name, std::string staging_path)
    : registry_(std::move(registry)),
      profile_(profile),
      file_(std::move(file)),
      context_(std::move(context)),
      storage_name_(std::move(storage_name)),
      staging_path_(std::move(staging_path)) {}

PendingUpload::~PendingUpload() { Abort("upload abandoned before completion"); }

core::Result<void> PendingUpload::Open() {
    auto staging = storage::EnsureDirectory(registry_->staging_dir());
    if (!staging.ok()) {
        return Reject(staging.error());
    }
    auto opened = writer_.Open(staging_path_);
    if (!opened.ok()) {
        return Reject(opened.error());
    }
    file_created_ = true;
    return core::Ok();
}

core::Result<void> PendingUpload::Append(const char* data, std::size_t size) {
    if (stage_ != PipelineStage::kMimeChecked || !writer_.is_open()) {
        return core::Error{core::ErrorCode::kInternal, "upload is no longer writable"};
    }
    if (writer_.bytes_written() + size > profile_->max_bytes) {
        return Reject(core::Error{core::ErrorCode::kFileTooLarge,
                                  SizeLimitMessage(profile_->max_bytes)});
    }
    auto written = writer_.Write(data, size);
    if (!written.ok()) {
        return Reject(written.error());
    }
    return core::Ok();
}

core::Result<StoredFile> PendingUpload::Commit() {
    if (stage_ != PipelineStage::kMimeChecked) {
        return core::Error{core::ErrorCode::kInternal, "upload already finished"};
    }
    auto closed = writer_.Close();
    if (!closed.ok()) {
        return Reject(closed.error());
    }
    stage_ = PipelineStage::kStored;

    // Byte-level checks read what actually landed on disk, not what the client streamed.
    auto leading = storage::ReadLeadingBytes(staging_path_, kScanWindowBytes);
    if (!leading.ok()) {
        return Reject(leading.error());
    }
    if (!MatchesSignature(leading.value(), file_.declared_mime_type)) {
        return Reject(core::Error{core::ErrorCode::kSignatureMismatch,
                                  "File type validation failed"});
    }
    stage_ = PipelineStage::kSignatureChecked;

    if (LooksMalicious(leading.value())) {
        return Reject(core::Error{core::ErrorCode::kMaliciousContent,
                                  "File contains potentially dangerous content"});
    }
    stage_ = PipelineStage::kContentScanned;

    auto size = storage::FileSize(staging_path_);
    if (!size.ok()) {
        return Reject(size.error());
    }
    if (size.value() > profile_->max_bytes) {
        return Reject(core::Error{core::ErrorCode::kFileTooLarge,
                                  SizeLimitMessage(profile_->max_bytes)});
    }

    auto destination = storage::EnsureDirectory(profile_->destination_dir);
    if (!destination.ok()) {
        return Reject(destination.error());
    }
    const auto final_path =
        (std::filesystem::path(profile_->destination_dir) / storage_name_).string();
    auto moved = storage::MoveFile(staging_path_, final_path);
    if (!moved.ok()) {
        return Reject(moved.error());
    }
    file_created_ = false;
    stage_ = PipelineStage::kAccepted;

    StoredFile stored;
    stored.storage_path = final_path;
    stored.storage_name = storage_name_;
    stored.original_name = file_.original_name;
    stored.size_bytes = size.value();
    stored.declared_mime_type = file_.declared_mime_type;
    stored.category = profile_->category;
    stored.created_at = core::NowIso8601();

    auto fields = UploadFields(profile_->category, file_, context_);
    fields.emplace_back("storage_name", storage_name_);
    fields.emplace_back("size", std::to_string(stored.size_bytes));
    core::LogEvent("upload_accepted", fields);
    observability::RecordUploadAccepted();
    return stored;
}

void PendingUpload::Abort(const std::string& reason) {
    if (stage_ == PipelineStage::kAccepted || stage_ == PipelineStage::kRejected) {
        return;
    }
    const auto stage = stage_;
    DiscardStagingFile();
    stage_ = PipelineStage::kRejected;

    auto fields = UploadFields(profile_->category, file_, context_);
    fields.emplace_back("stage", StageName(stage));
    fields.emplace_back("reason", reason);
    fields.emplace_back("bytes_received", std::to_string(writer_.bytes_written()));
    core::LogWarningEvent("upload_aborted", fields);
    observability::RecordUploadAborted();
}

core::Error PendingUpload::Reject(core::Error error) {
    const auto stage = stage_;
    DiscardStagingFile();
    stage_ = PipelineStage::kRejected;
    LogRejection(stage, error, UploadFields(profile_->category, file_, context_));
    return error;
}

void PendingUpload::DiscardStagingFile() {
    writer_.Abandon();
    if (!file_created_) {
        return;
    }
    auto removed = storage::RemoveFile(staging_path_);
    if (!removed.ok()) {
        core::LogError("Failed to delete rejected upload: " + removed.error().message);
    }
    file_created_ = false;
}

IngestionPipeline::IngestionPipeline(std::shared_ptr<const TypeProfileRegistry> registry)
    : registry_(std::move(registry)) {}

core::Result<void> IngestionPipeline::ValidateMetadata(UploadCategory category,
                                                       const IncomingFile& file) const {
    const auto& profile = registry_->ProfileFor(category);
    if (!IsSafeFilename(file.original_name)) {
        return core::Error{core::ErrorCode::kUnsafeFilename, "Invalid filename"};
    }
    const auto extension = ExtensionOf(file.original_name);
    if (!profile.AllowsExtension(extension)) {
        return core::Error{core::ErrorCode::kUnsupportedExtension,
                           "File type " + (extension.empty() ? std::string("(none)") : extension) +
                               " not allowed. Allowed types: " +
                               JoinExtensions(profile.allowed_extensions)};
    }
    if (!profile.AllowsMimeType(file.declared_mime_type)) {
        return core::Error{core::ErrorCode::kUnsupportedMimeType,
                           "MIME type " + file.declared_mime_type + " not allowed"};
    }
    if (file.size_bytes && *file.size_bytes > profile.max_bytes) {
        return core::Error{core::ErrorCode::kFileTooLarge, SizeLimitMessage(profile.max_bytes)};
    }
    return core::Ok();
}

core::Result<std::unique_ptr<PendingUpload>> IngestionPipeline::Begin(
    UploadCategory category, const IncomingFile& file, const UploadContext& context) const {
    auto valid = ValidateMetadata(category, file);
    if (!valid.ok()) {
        LogRejection(StageOfMetadataFailure(valid.code()), valid.error(),
                     UploadFields(category, file, context));
        return valid.error();
    }

    auto name = GenerateSecureName(file.original_name);
    if (!name.ok()) {
        LogRejection(PipelineStage::kMimeChecked, name.error(),
                     UploadFields(category, file, context));
        return name.error();
    }
    const auto staging_path =
        (std::filesystem::path(registry_->staging_dir()) / name.value()).string();

    auto pending = std::make_unique<PendingUpload>(PendingUpload::PassKey{}, registry_,
                                                   &registry_->ProfileFor(category), file,
                                                   context, name.value(), staging_path);
    auto opened = pending->Open();
    if (!opened.ok()) {
        return opened.error();
    }
    core::LogDebug("Upload staged at " + staging_path + " for " + CategoryName(category));
    return std::move(pending);
}

core::Result<StoredFile> IngestionPipeline::Ingest(UploadCategory category,
                                                   const IncomingFile& file, std::istream& data,
                                                   const UploadContext& context) const {
    auto begun = Begin(category, file, context);
    if (!begun.ok()) {
        return begun.error();
    }
    auto pending = begun.TakeValue();

    std::array<char, kChunkSize> buffer{};
    while (data) {
        data.read(buffer.data(), buffer.size());
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        auto appended = pending->Append(buffer.data(), static_cast<std::size_t>(bytes));
        if (!appended.ok()) {
            return appended.error();
        }
    }
    if (data.bad()) {
        pending->Abort("upload stream read failed");
        return core::Error{core::ErrorCode::kInvalidArgument, "upload stream interrupted"};
    }
    return pending->Commit();
}

UploadBatch::UploadBatch(const IngestionPipeline& pipeline, UploadCategory category,
                         std::size_t max_files, UploadContext context)
    : pipeline_(pipeline),
      category_(category),
      max_files_(max_files),
      context_(std::move(context)) {}

UploadBatch::~UploadBatch() {
    if (!released_) {
        Rollback();
    }
}

core::Result<StoredFile> UploadBatch::Add(const IncomingFile& file, std::istream& data) {
    if (failed_ || released_) {
        return core::Error{core::ErrorCode::kInvalidArgument, "upload batch is closed"};
    }
    if (attempted_ >= max_files_) {
        return Fail(file, core::Error{core::ErrorCode::kTooManyFiles, "Too many files"});
    }
    ++attempted_;

    auto stored = pipeline_.Ingest(category_, file, data, context_);
    if (!stored.ok()) {
        failed_ = true;
        Rollback();
        return stored.error();
    }
    accepted_.push_back(stored.value());
    return stored;
}

core::Error UploadBatch::Fail(const IncomingFile& file, core::Error error) {
    failed_ = true;
    Rollback();
    LogRejection(PipelineStage::kReceived, error, UploadFields(category_, file, context_));
    return error;
}

std::vector<StoredFile> UploadBatch::Release() {
    released_ = true;
    return std::move(accepted_);
}

void UploadBatch::Rollback() {
    for (const auto& stored : accepted_) {
        auto removed = storage::RemoveFile(stored.storage_path);
        if (!removed.ok()) {
            core::LogError("Failed to roll back upload: " + removed.error().message);
            continue;
        }
        core::LogWarningEvent("upload_rolled_back",
                              {{"category", CategoryName(stored.category)},
                               {"storage_name", stored.storage_name},
                               {"original_name", stored.original_name},
                               {"request_id", context_.request_id}});
    }
    accepted_.clear();
}

}  // namespace uploadguard::upload
