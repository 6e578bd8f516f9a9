#include <string>

#include <gtest/gtest.h>

#include "uploadguard/http/responses.h"
#include "uploadguard/http/router.h"

namespace beast_http = boost::beast::http;

using uploadguard::http::HttpRequest;
using uploadguard::http::HttpResponse;
using uploadguard::http::RequestContext;
using uploadguard::http::RouteParams;
using uploadguard::http::Router;

TEST(Router, MatchesTemplatedSegments) {
    RouteParams params;
    EXPECT_TRUE(Router::Match("/v1/uploads/{preset}", "/v1/uploads/avatar", &params));
    EXPECT_EQ(params["preset"], "avatar");
    EXPECT_FALSE(Router::Match("/v1/uploads/{preset}", "/v1/uploads", nullptr));
    EXPECT_FALSE(Router::Match("/v1/uploads/{preset}", "/v1/uploads/a/b", nullptr));
}

TEST(Router, DistinguishesUnknownPathFromWrongMethod) {
    Router router;
    router.Add("POST", "/v1/maintenance/sweep",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   return uploadguard::http::JsonOk(req.version(), "{}");
               });
    RequestContext ctx;
    ctx.request_id = "req-1";

    HttpRequest get{beast_http::verb::get, "/v1/maintenance/sweep", 11};
    auto wrong_method = router.Route(ctx, get);
    ASSERT_TRUE(wrong_method.ok());
    EXPECT_EQ(wrong_method.value().result(), beast_http::status::method_not_allowed);

    HttpRequest missing{beast_http::verb::get, "/nope", 11};
    auto not_found = router.Route(ctx, missing);
    ASSERT_TRUE(not_found.ok());
    EXPECT_EQ(not_found.value().result(), beast_http::status::not_found);

    HttpRequest post{beast_http::verb::post, "/v1/maintenance/sweep?now=1", 11};
    auto routed = router.Route(ctx, post);
    ASSERT_TRUE(routed.ok());
    EXPECT_EQ(routed.value().result(), beast_http::status::ok);
}

TEST(Router, HandlerSeesTheCallersRequest) {
    Router router;
    const HttpRequest* seen_request = nullptr;
    const RequestContext* seen_ctx = nullptr;
    router.Add("POST", "/v1/uploads/{preset}",
               [&](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   seen_request = &req;
                   seen_ctx = &ctx;
                   return uploadguard::http::JsonOk(req.version(), "{}");
               });
    RequestContext ctx;
    HttpRequest upload{beast_http::verb::post, "/v1/uploads/images", 11};
    upload.body() = std::string(64 * 1024, 'x');

    ASSERT_TRUE(router.Route(ctx, upload).ok());
    // Bodies can be large; routing must not copy them.
    EXPECT_EQ(seen_request, &upload);
    EXPECT_EQ(seen_ctx, &ctx);
}

TEST(Responses, MapsErrorCodesToStatuses) {
    using uploadguard::core::ErrorCode;
    using uploadguard::http::StatusFor;
    EXPECT_EQ(StatusFor(ErrorCode::kSignatureMismatch), beast_http::status::bad_request);
    EXPECT_EQ(StatusFor(ErrorCode::kTooManyFiles), beast_http::status::bad_request);
    EXPECT_EQ(StatusFor(ErrorCode::kNotFound), beast_http::status::not_found);
    EXPECT_EQ(StatusFor(ErrorCode::kStorageIo), beast_http::status::internal_server_error);
    EXPECT_EQ(StatusFor(ErrorCode::kInternal), beast_http::status::internal_server_error);
}

TEST(Responses, ErrorEnvelopeEscapesMessage) {
    const HttpResponse response = uploadguard::http::JsonError(
        11,
        uploadguard::core::Error{uploadguard::core::ErrorCode::kUnsupportedMimeType,
                                 "MIME type \"html\" not allowed"},
        "req-9");
    EXPECT_EQ(response.result(), beast_http::status::bad_request);
    EXPECT_NE(response.body().find("\"code\":\"UNSUPPORTED_MIME_TYPE\""), std::string::npos);
    EXPECT_NE(response.body().find("\\\"html\\\""), std::string::npos);
    EXPECT_NE(response.body().find("\"request_id\":\"req-9\""), std::string::npos);
}

TEST(Responses, QueryParamsAreDecoded) {
    EXPECT_EQ(uploadguard::http::GetQueryParam("/v1/uploads/image?name=my%20cat.png", "name"),
              "my cat.png");
    EXPECT_EQ(uploadguard::http::GetQueryParam("/v1/uploads/image", "name"), "");
    EXPECT_EQ(uploadguard::http::BareMediaType(" Image/PNG ; charset=binary"), "image/png");
}
