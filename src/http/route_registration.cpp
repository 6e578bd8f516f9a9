#include "uploadguard/http/route_registration.h"

#include <sstream>
#include <string>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/Net/MediaType.h>
#include <Poco/Net/MessageHeader.h>
#include <Poco/Net/MultipartReader.h>
#include <Poco/Net/NameValueCollection.h>

#include "uploadguard/http/responses.h"
#include "uploadguard/observability/metrics.h"
#include "uploadguard/upload/ingestion_pipeline.h"
#include "uploadguard/upload/retention_sweeper.h"
#include "uploadguard/upload/upload_preset.h"

namespace uploadguard::http {
namespace {

std::string CategoriesJson(const upload::TypeProfileRegistry& registry) {
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (const auto& profile : registry.profiles()) {
        Poco::JSON::Array::Ptr extensions = new Poco::JSON::Array();
        for (const auto& extension : profile.allowed_extensions) {
            extensions->add(extension);
        }
        Poco::JSON::Array::Ptr mime_types = new Poco::JSON::Array();
        for (const auto& mime_type : profile.allowed_mime_types) {
            mime_types->add(mime_type);
        }
        Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
        item->set("name", std::string(upload::CategoryName(profile.category)));
        item->set("extensions", extensions);
        item->set("mime_types", mime_types);
        item->set("max_bytes", static_cast<Poco::UInt64>(profile.max_bytes));
        item->set("directory", profile.directory_name);
        arr->add(item);
    }
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("categories", arr);
    std::stringstream ss;
    root->stringify(ss);
    return ss.str();
}

void DrainPart(std::istream& part) {
    char scratch[1024];
    while (part) {
        part.read(scratch, sizeof(scratch));
    }
}

/// Feeds every file part of a multipart/form-data body through one all-or-nothing batch.
core::Result<std::vector<upload::StoredFile>> IngestMultipart(
    const upload::IngestionPipeline& pipeline, const upload::UploadPreset& preset,
    std::size_t max_files, const RequestContext& ctx, const HttpRequest& req) {
    upload::UploadBatch batch(pipeline, preset.category, max_files,
                              upload::UploadContext{ctx.request_id, ctx.user_id, ctx.remote});
    try {
        const Poco::Net::MediaType media_type(
            std::string(req[boost::beast::http::field::content_type]));
        const auto boundary = media_type.getParameter("boundary");
        std::istringstream body(req.body());
        Poco::Net::MultipartReader reader(body, boundary);
        while (reader.hasNextPart()) {
            Poco::Net::MessageHeader header;
            reader.nextPart(header);

            std::string disposition;
            Poco::Net::NameValueCollection params;
            Poco::Net::MessageHeader::splitParameters(header.get("Content-Disposition", ""),
                                                      disposition, params);
            if (!params.has("filename")) {
                // Plain form fields carry no file; they are not ours to interpret.
                DrainPart(reader.stream());
                continue;
            }

            upload::IncomingFile file;
            file.original_name = params.get("filename");
            file.declared_mime_type =
                BareMediaType(header.get("Content-Type", "application/octet-stream"));
            if (params.get("name", "") != preset.field_name) {
                return batch.Fail(file, core::Error{core::ErrorCode::kUnexpectedField,
                                                    "Unexpected file field"});
            }
            auto stored = batch.Add(file, reader.stream());
            if (!stored.ok()) {
                return stored.error();
            }
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "malformed multipart body: " + ex.displayText()};
    }

    if (batch.size() == 0) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "no file in form field '" + preset.field_name + "'"};
    }
    return batch.Release();
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::IngestionPipeline> pipeline,
                           std::shared_ptr<upload::RetentionSweeper> sweeper,
                           const core::Config& config) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("GET", "/v1/categories",
               [pipeline](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(), CategoriesJson(pipeline->registry()));
               });

    // Raw-body uploads never reach the router; the session streams them straight to disk.
    router.Add("POST", "/v1/uploads/{preset}",
               [pipeline, max_files = static_cast<std::size_t>(config.upload.max_files_per_request)](
                   const RequestContext& ctx, const HttpRequest& req, const RouteParams& params) {
                   auto preset = upload::FindPreset(params.at("preset"));
                   if (!preset.ok()) {
                       return JsonError(req.version(), preset.error(), ctx.request_id);
                   }
                   auto stored = IngestMultipart(*pipeline, preset.value(),
                                                 upload::MaxFilesFor(preset.value(), max_files),
                                                 ctx, req);
                   if (!stored.ok()) {
                       return JsonError(req.version(), stored.error(), ctx.request_id);
                   }
                   return JsonOk(req.version(), StoredFilesJson(stored.value()));
               });

    router.Add("POST", "/v1/maintenance/sweep",
               [sweeper](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(), SweepReportJson(sweeper->SweepOnce()));
               });
}

}  // namespace uploadguard::http
