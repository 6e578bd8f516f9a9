#pragma once

#include <string>
#include <vector>

#include <boost/beast/http/status.hpp>

#include "uploadguard/core/error.h"
#include "uploadguard/http/router.h"
#include "uploadguard/upload/ingestion_pipeline.h"
#include "uploadguard/upload/retention_sweeper.h"

namespace uploadguard::http {

/// @brief 400 for client-caused codes, 404 for kNotFound, 500 otherwise.
boost::beast::http::status StatusFor(core::ErrorCode code);

HttpResponse JsonOk(int version, const std::string& body);
/// @brief `{"error":{"code","message","request_id"}}` with the status mapped from the code.
HttpResponse JsonError(int version, const core::Error& error, const std::string& request_id);
HttpResponse JsonError(int version, boost::beast::http::status status, const std::string& code,
                       const std::string& message, const std::string& request_id);

/// @brief `{"files":[...]}` body returned for accepted uploads.
std::string StoredFilesJson(const std::vector<upload::StoredFile>& files);
std::string SweepReportJson(const upload::SweepReport& report);

/// @brief Decoded value of a query parameter, or empty when absent.
std::string GetQueryParam(const std::string& target, const std::string& key);
/// @brief Media type without parameters, lower-cased ("image/png; x=y" -> "image/png").
std::string BareMediaType(const std::string& content_type);

}  // namespace uploadguard::http
