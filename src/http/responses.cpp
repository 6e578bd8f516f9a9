#include "uploadguard/http/responses.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/URI.h>

namespace uploadguard::http {

namespace beast_http = boost::beast::http;

namespace {

std::string Stringify(const Poco::JSON::Object::Ptr& object) {
    std::stringstream ss;
    object->stringify(ss);
    return ss.str();
}

}  // namespace

beast_http::status StatusFor(core::ErrorCode code) {
    if (code == core::ErrorCode::kNotFound) {
        return beast_http::status::not_found;
    }
    if (core::IsClientError(code)) {
        return beast_http::status::bad_request;
    }
    return beast_http::status::internal_server_error;
}

HttpResponse JsonOk(int version, const std::string& body) {
    HttpResponse response{beast_http::status::ok, version};
    response.set(beast_http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse JsonError(int version, const core::Error& error, const std::string& request_id) {
    return JsonError(version, StatusFor(error.code), core::ErrorCodeName(error.code),
                     error.message, request_id);
}

HttpResponse JsonError(int version, beast_http::status status, const std::string& code,
                       const std::string& message, const std::string& request_id) {
    // Messages can echo client input (MIME types, extensions), so they go through the encoder.
    Poco::JSON::Object::Ptr detail = new Poco::JSON::Object();
    detail->set("code", code);
    detail->set("message", message);
    detail->set("request_id", request_id);
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", detail);

    HttpResponse response{status, version};
    response.set(beast_http::field::content_type, "application/json");
    response.body() = Stringify(root);
    response.prepare_payload();
    return response;
}

std::string StoredFilesJson(const std::vector<upload::StoredFile>& files) {
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (const auto& file : files) {
        Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
        item->set("path", file.storage_path);
        item->set("name", file.storage_name);
        item->set("original_name", file.original_name);
        item->set("size", static_cast<Poco::UInt64>(file.size_bytes));
        item->set("mime_type", file.declared_mime_type);
        item->set("category", std::string(upload::CategoryName(file.category)));
        item->set("created_at", file.created_at);
        arr->add(item);
    }
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("files", arr);
    return Stringify(root);
}

std::string SweepReportJson(const upload::SweepReport& report) {
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("ran", report.ran);
    root->set("directories", static_cast<Poco::UInt64>(report.directories));
    root->set("scanned", static_cast<Poco::UInt64>(report.scanned));
    root->set("deleted", static_cast<Poco::UInt64>(report.deleted));
    root->set("failed", static_cast<Poco::UInt64>(report.failed));
    return Stringify(root);
}

std::string GetQueryParam(const std::string& target, const std::string& key) {
    try {
        const Poco::URI uri(target);
        for (const auto& [name, value] : uri.getQueryParameters()) {
            if (name == key) {
                return value;
            }
        }
    } catch (const Poco::SyntaxException&) {
        // A malformed query is treated like a missing parameter.
    }
    return "";
}

std::string BareMediaType(const std::string& content_type) {
    auto bare = content_type.substr(0, content_type.find(';'));
    const auto begin = bare.find_first_not_of(" \t");
    const auto end = bare.find_last_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    bare = bare.substr(begin, end - begin + 1);
    std::transform(bare.begin(), bare.end(), bare.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return bare;
}

}  // namespace uploadguard::http
