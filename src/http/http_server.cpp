#include "uploadguard/http/http_server.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "uploadguard/core/ids.h"
#include "uploadguard/core/logger.h"
#include "uploadguard/http/responses.h"
#include "uploadguard/observability/metrics.h"
#include "uploadguard/upload/upload_preset.h"

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::size_t kBufferSize = 8192;
constexpr const char* kUploadRoute = "/v1/uploads/{preset}";

std::string StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

uploadguard::core::Error BodyTooLarge(std::uint64_t limit) {
    return uploadguard::core::Error{
        uploadguard::core::ErrorCode::kFileTooLarge,
        "Request body exceeds maximum limit of " + std::to_string(limit) + " bytes"};
}

template <typename Request>
bool IsMultipart(const Request& request) {
    return uploadguard::http::BareMediaType(std::string(request[http::field::content_type]))
               .rfind("multipart/", 0) == 0;
}

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    Session(Stream&& stream, uploadguard::http::Router router, uploadguard::core::Config config,
            std::shared_ptr<uploadguard::upload::IngestionPipeline> pipeline)
        : stream_(std::move(stream)),
          router_(std::move(router)),
          config_(std::move(config)),
          pipeline_(std::move(pipeline)) {
    }

    void Start() {
        // TLS handshake happens once per connection when enabled.
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.async_handshake(net::ssl::stream_base::server,
                                    beast::bind_front_handler(&Session::OnHandshake,
                                                              this->shared_from_this()));
        } else {
            DoReadHeader();
        }
    }

private:
    void OnHandshake(beast::error_code ec) {
        if (ec) {
            uploadguard::core::LogError("TLS handshake failed: " + ec.message());
            return;
        }
        DoReadHeader();
    }

    void DoReadHeader() {
        upload_preset_.clear();
        body_limit_ = 0;
        parser_.emplace();
        parser_->body_limit(config_.server.limits.max_body_bytes);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          this->shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            uploadguard::core::LogError("Read header failed: " + ec.message());
            return;
        }

        request_id_ = uploadguard::core::GenerateRequestId();
        request_start_ = std::chrono::steady_clock::now();
        request_method_ = std::string(parser_->get().method_string());
        request_target_ = std::string(parser_->get().target());
        request_remote_ = GetRemoteAddress();
        request_user_ = std::string(parser_->get()["X-User-Id"]);
        const auto path = StripQuery(request_target_);

        uploadguard::http::RouteParams params;
        if (parser_->get().method() == http::verb::post &&
            uploadguard::http::Router::Match(kUploadRoute, path, &params)) {
            // Fast-path: raw-body uploads stream through the pipeline without buffering.
            if (!IsMultipart(parser_->get())) {
                StartUpload(params["preset"]);
                return;
            }
            if (!LimitMultipartBody(params["preset"])) {
                return;
            }
        }

        if (parser_->is_done()) {
            body_.clear();
            return HandleRequest();
        }
        ReadBodyToString();
    }

    // Multipart bodies are buffered before parsing, so they are capped at the most the preset
    // could accept. A declared length over the cap is refused before any body byte is read.
    bool LimitMultipartBody(const std::string& preset_name) {
        auto preset = uploadguard::upload::FindPreset(preset_name);
        if (!preset.ok()) {
            SendError(preset.error(), true);
            return false;
        }
        const auto& profile = pipeline_->registry().ProfileFor(preset.value().category);
        const auto limit = std::min<std::uint64_t>(
            uploadguard::upload::MultipartBodyLimit(
                preset.value(), profile,
                static_cast<std::size_t>(config_.upload.max_files_per_request)),
            config_.server.limits.max_body_bytes);
        if (parser_->content_length() && parser_->content_length().value() > limit) {
            RejectOversizedBody(preset_name, limit);
            return false;
        }
        // Chunked bodies are cut off by the parser once they pass the limit.
        parser_->body_limit(limit);
        body_limit_ = limit;
        upload_preset_ = preset_name;
        return true;
    }

    void RejectOversizedBody(const std::string& preset_name, std::uint64_t limit) {
        const auto error = BodyTooLarge(limit);
        uploadguard::core::LogWarningEvent(
            "upload_rejected",
            {{"preset", preset_name},
             {"stage", "received"},
             {"error", uploadguard::core::ErrorCodeName(error.code)},
             {"message", error.message},
             {"request_id", request_id_},
             {"user_id", request_user_},
             {"remote", request_remote_}});
        uploadguard::observability::RecordUploadRejected(error.code);
        SendError(error, true);
    }

    void ReadBodyToString() {
        body_.clear();
        if (parser_->content_length() && parser_->content_length().value() == 0) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void DoReadBodyChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBodyChunk,
                                                   this->shared_from_this()));
    }

    void OnBodyChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            if (!upload_preset_.empty()) {
                return RejectOversizedBody(upload_preset_, body_limit_);
            }
            return SendError(BodyTooLarge(config_.server.limits.max_body_bytes), true);
        }
        if (ec && ec != http::error::need_buffer) {
            uploadguard::core::LogError("Read body failed: " + ec.message());
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        body_.append(body_buffer_.data(), bytes);
        if (parser_->is_done()) {
            return HandleRequest();
        }
        DoReadBodyChunk();
    }

    void HandleRequest() {
        // Convert buffer_body parser into a string_body request for routing handlers.
        uploadguard::http::HttpRequest request;
        request.method(parser_->get().method());
        request.target(parser_->get().target());
        request.version(parser_->get().version());
        for (const auto& field : parser_->get()) {
            request.set(field.name_string(), field.value());
        }
        request.body() = std::move(body_);
        request.prepare_payload();

        uploadguard::http::RequestContext ctx;
        ctx.request_id = request_id_;
        ctx.method = request_method_;
        ctx.target = request_target_;
        ctx.remote = request_remote_;
        ctx.user_id = request_user_;

        auto result = router_.Route(ctx, request);
        if (!result.ok()) {
            return SendError(result.error(), false);
        }
        Send(std::move(result.value()));
    }

    void StartUpload(const std::string& preset_name) {
        auto preset = uploadguard::upload::FindPreset(preset_name);
        if (!preset.ok()) {
            return SendError(preset.error(), true);
        }
        const auto name = uploadguard::http::GetQueryParam(request_target_, "name");
        if (name.empty()) {
            return SendError(
                uploadguard::core::Error{uploadguard::core::ErrorCode::kInvalidArgument,
                                         "missing name query parameter"},
                true);
        }

        uploadguard::upload::IncomingFile file;
        file.original_name = name;
        file.declared_mime_type = uploadguard::http::BareMediaType(
            std::string(parser_->get()[http::field::content_type]));
        if (parser_->content_length()) {
            file.size_bytes = parser_->content_length().value();
        }

        auto begun = pipeline_->Begin(
            preset.value().category, file,
            uploadguard::upload::UploadContext{request_id_, request_user_, request_remote_});
        if (!begun.ok()) {
            // The body is left unread, so the connection cannot be reused.
            return SendError(begun.error(), true);
        }
        pending_ = begun.TakeValue();
        if (parser_->is_done()) {
            return FinishUpload();
        }
        DoReadUploadChunk();
    }

    void DoReadUploadChunk() {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnUploadChunk,
                                                   this->shared_from_this()));
    }

    void OnUploadChunk(beast::error_code ec, std::size_t) {
        if (ec && ec != http::error::need_buffer) {
            uploadguard::core::LogError("Read upload failed: " + ec.message());
            pending_->Abort("client stream failed: " + ec.message());
            pending_.reset();
            return;
        }
        const auto bytes = body_buffer_.size() - parser_->get().body().size;
        if (bytes > 0) {
            auto appended = pending_->Append(body_buffer_.data(), bytes);
            if (!appended.ok()) {
                pending_.reset();
                return SendError(appended.error(), true);
            }
        }

        if (parser_->is_done()) {
            return FinishUpload();
        }
        DoReadUploadChunk();
    }

    void FinishUpload() {
        auto stored = pending_->Commit();
        pending_.reset();
        if (!stored.ok()) {
            return SendError(stored.error(), false);
        }
        Send(uploadguard::http::JsonOk(parser_->get().version(),
                                       uploadguard::http::StoredFilesJson({stored.value()})));
    }

    void SendError(const uploadguard::core::Error& error, bool close) {
        auto response = uploadguard::http::JsonError(parser_->get().version(), error, request_id_);
        if (close) {
            response.keep_alive(false);
        }
        Send(std::move(response));
    }

    template <typename Body>
    void Send(http::response<Body>&& response) {
        response.set(http::field::server, "UploadGuard");
        response.set("X-Request-Id", request_id_);
        const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - request_start_)
                                 .count();
        uploadguard::core::LogRequest(request_id_, request_method_, request_target_,
                                      request_remote_, response.result_int(), latency);
        uploadguard::observability::RecordRequest(response.result_int(), latency);
        auto sp = std::make_shared<http::response<Body>>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite<Body>,
                                                    this->shared_from_this(), sp->need_eof(), sp));
    }

    template <typename Body>
    void OnWrite(bool close, std::shared_ptr<http::response<Body>>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            uploadguard::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        if constexpr (std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>) {
            stream_.shutdown(ec);
        } else {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
        if (ec && ec != beast::errc::not_connected) {
            uploadguard::core::LogDebug("Shutdown failed: " + ec.message());
        }
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    Stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::array<char, kBufferSize> body_buffer_{};

    uploadguard::http::Router router_;
    uploadguard::core::Config config_;
    std::shared_ptr<uploadguard::upload::IngestionPipeline> pipeline_;

    std::string request_id_;
    std::string request_method_;
    std::string request_target_;
    std::string request_remote_;
    std::string request_user_;
    std::chrono::steady_clock::time_point request_start_{};
    std::string body_;
    // Set while a multipart upload body is being buffered under its preset's cap.
    std::string upload_preset_;
    std::uint64_t body_limit_{0};

    // Destroying the session mid-transfer discards the staged file.
    std::unique_ptr<uploadguard::upload::PendingUpload> pending_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint, uploadguard::http::Router router,
             uploadguard::core::Config config,
             std::shared_ptr<uploadguard::upload::IngestionPipeline> pipeline,
             net::ssl::context* ssl_ctx)
        : acceptor_(ioc),
          router_(std::move(router)),
          config_(std::move(config)),
          pipeline_(std::move(pipeline)),
          ssl_ctx_(ssl_ctx) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            Fail("open", ec);
            return;
        }
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            Fail("set_option", ec);
            return;
        }
        acceptor_.bind(endpoint, ec);
        if (ec) {
            Fail("bind", ec);
            return;
        }
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            Fail("listen", ec);
            return;
        }
        ready_ = true;
    }

    bool ready() const { return ready_; }
    void Run() { DoAccept(); }

private:
    void Fail(const std::string& what, const beast::error_code& ec) {
        uploadguard::core::LogError("Listener " + what + " failed: " + ec.message());
    }

    void DoAccept() {
        acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            uploadguard::core::LogError("Accept failed: " + ec.message());
        } else {
            if (ssl_ctx_) {
                auto stream = beast::ssl_stream<beast::tcp_stream>(std::move(socket), *ssl_ctx_);
                std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                    std::move(stream), router_, config_, pipeline_)
                    ->Start();
            } else {
                auto stream = beast::tcp_stream(std::move(socket));
                std::make_shared<Session<beast::tcp_stream>>(std::move(stream), router_, config_,
                                                             pipeline_)
                    ->Start();
            }
        }
        DoAccept();
    }

    tcp::acceptor acceptor_;
    uploadguard::http::Router router_;
    uploadguard::core::Config config_;
    std::shared_ptr<uploadguard::upload::IngestionPipeline> pipeline_;
    net::ssl::context* ssl_ctx_{nullptr};
    bool ready_{false};
};

}  // namespace

namespace uploadguard::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<upload::IngestionPipeline> pipeline,
                       std::shared_ptr<upload::RetentionSweeper> sweeper)
    : ioc_(ioc),
      config_(config),
      router_(std::move(router)),
      pipeline_(std::move(pipeline)),
      sweeper_(std::move(sweeper)) {
    if (config_.server.tls.enabled) {
        ssl_context_ = std::make_unique<net::ssl::context>(net::ssl::context::tlsv12_server);
        ssl_context_->use_certificate_chain_file(config_.server.tls.certificate);
        ssl_context_->use_private_key_file(config_.server.tls.private_key, net::ssl::context::pem);
    }
}

bool HttpServer::Run() {
    beast::error_code ec;
    const auto address = net::ip::make_address(config_.server.host, ec);
    if (ec) {
        core::LogError("Invalid server.host '" + config_.server.host + "': " + ec.message());
        return false;
    }
    const tcp::endpoint endpoint{address, static_cast<unsigned short>(config_.server.port)};

    auto listener = std::make_shared<Listener>(ioc_, endpoint, router_, config_, pipeline_,
                                               ssl_context_ ? ssl_context_.get() : nullptr);
    if (!listener->ready()) {
        return false;
    }
    listener->Run();
    StartRetentionJob();
    core::LogInfo("Listening on " + config_.server.host + ":" +
                  std::to_string(config_.server.port));
    return true;
}

void HttpServer::StartRetentionJob() {
    if (!config_.retention.enabled) {
        return;
    }
    retention_timer_ = std::make_unique<net::steady_timer>(ioc_);
    ScheduleRetentionSweep();
}

void HttpServer::ScheduleRetentionSweep() {
    if (!retention_timer_) {
        return;
    }
    retention_timer_->expires_after(
        std::chrono::seconds(config_.retention.sweep_interval_seconds));
    retention_timer_->async_wait([this](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        sweeper_->SweepOnce();
        ScheduleRetentionSweep();
    });
}

}  // namespace uploadguard::http
