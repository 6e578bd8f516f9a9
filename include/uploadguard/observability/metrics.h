#pragma once

#include <cstdint>
#include <string>

#include "uploadguard/core/error.h"

namespace uploadguard::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);

void RecordUploadAccepted();
/// @brief Counted per error code so rejections can be broken down by reason.
void RecordUploadRejected(core::ErrorCode code);
void RecordUploadAborted();
void RecordSweep(std::uint64_t deleted, std::uint64_t failed);

}  // namespace uploadguard::observability
