#include "uploadguard/http/router.h"

#include <sstream>

#include "uploadguard/http/responses.h"

namespace uploadguard::http {

void Router::Add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(RouteEntry{method, pattern, std::move(handler)});
}

core::Result<HttpResponse> Router::Route(const RequestContext& ctx,
                                        const HttpRequest& request) const {
    const auto target = std::string(request.target());
    const auto path = target.substr(0, target.find('?'));

    bool path_known = false;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!Match(route.pattern, path, &params)) {
            continue;
        }
        if (route.method != request.method_string()) {
            path_known = true;
            continue;
        }
        return route.handler(ctx, request, params);
    }

    if (path_known) {
        return JsonError(request.version(), boost::beast::http::status::method_not_allowed,
                         "METHOD_NOT_ALLOWED", "method not allowed", ctx.request_id);
    }
    return JsonError(request.version(), boost::beast::http::status::not_found, "NOT_FOUND",
                     "route not found", ctx.request_id);
}

std::vector<std::string> Router::SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    const auto pattern_parts = SplitPath(pattern);
    const auto path_parts = SplitPath(path);
    if (pattern_parts.size() != path_parts.size()) {
        return false;
    }

    for (size_t i = 0; i < pattern_parts.size(); ++i) {
        const auto& p = pattern_parts[i];
        const auto& v = path_parts[i];
        if (p.size() >= 2 && p.front() == '{' && p.back() == '}') {
            if (out_params) {
                (*out_params)[p.substr(1, p.size() - 2)] = v;
            }
        } else if (p != v) {
            return false;
        }
    }
    return true;
}

}  // namespace uploadguard::http
