#include "uploadguard/observability/metrics.h"

#include <array>
#include <atomic>

namespace uploadguard::observability {
namespace {
constexpr std::size_t kErrorCodeCount = static_cast<std::size_t>(core::ErrorCode::kInternal) + 1;

std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_uploads_accepted{0};
std::atomic<std::uint64_t> g_uploads_aborted{0};
std::array<std::atomic<std::uint64_t>, kErrorCodeCount> g_uploads_rejected{};
std::atomic<std::uint64_t> g_sweeps{0};
std::atomic<std::uint64_t> g_swept_files{0};
std::atomic<std::uint64_t> g_sweep_failures{0};

std::string Counter(const std::string& name, const std::string& help, std::uint64_t value) {
    return "# HELP " + name + " " + help + "\n# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordUploadAccepted() { g_uploads_accepted.fetch_add(1, std::memory_order_relaxed); }

void RecordUploadRejected(core::ErrorCode code) {
    const auto index = static_cast<std::size_t>(code);
    if (index < g_uploads_rejected.size()) {
        g_uploads_rejected[index].fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordUploadAborted() { g_uploads_aborted.fetch_add(1, std::memory_order_relaxed); }

void RecordSweep(std::uint64_t deleted, std::uint64_t failed) {
    g_sweeps.fetch_add(1, std::memory_order_relaxed);
    g_swept_files.fetch_add(deleted, std::memory_order_relaxed);
    g_sweep_failures.fetch_add(failed, std::memory_order_relaxed);
}

std::string RenderMetrics() {
    std::string out =
        "# HELP uploadguard_up 1 if server is up\n"
        "# TYPE uploadguard_up gauge\n"
        "uploadguard_up 1\n";
    out += Counter("uploadguard_http_requests_total", "Total HTTP requests processed",
                   g_total_requests.load(std::memory_order_relaxed));
    out += Counter("uploadguard_http_requests_2xx", "Total 2xx responses",
                   g_requests_2xx.load(std::memory_order_relaxed));
    out += Counter("uploadguard_http_requests_4xx", "Total 4xx responses",
                   g_requests_4xx.load(std::memory_order_relaxed));
    out += Counter("uploadguard_http_requests_5xx", "Total 5xx responses",
                   g_requests_5xx.load(std::memory_order_relaxed));
    out += Counter("uploadguard_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total.load(std::memory_order_relaxed));
    out += Counter("uploadguard_uploads_accepted_total", "Files that passed every check",
                   g_uploads_accepted.load(std::memory_order_relaxed));
    out += Counter("uploadguard_uploads_aborted_total", "Uploads abandoned mid-transfer",
                   g_uploads_aborted.load(std::memory_order_relaxed));

    out += "# HELP uploadguard_uploads_rejected_total Files rejected, by reason\n"
           "# TYPE uploadguard_uploads_rejected_total counter\n";
    for (std::size_t i = 0; i < g_uploads_rejected.size(); ++i) {
        const auto code = static_cast<core::ErrorCode>(i);
        if (code == core::ErrorCode::kOk) {
            continue;
        }
        out += "uploadguard_uploads_rejected_total{reason=\"" +
               std::string(core::ErrorCodeName(code)) + "\"} " +
               std::to_string(g_uploads_rejected[i].load(std::memory_order_relaxed)) + "\n";
    }

    out += Counter("uploadguard_retention_sweeps_total", "Completed retention sweeps",
                   g_sweeps.load(std::memory_order_relaxed));
    out += Counter("uploadguard_retention_deleted_total", "Files deleted by retention sweeps",
                   g_swept_files.load(std::memory_order_relaxed));
    out += Counter("uploadguard_retention_failures_total", "Files a sweep failed to delete",
                   g_sweep_failures.load(std::memory_order_relaxed));
    return out;
}

}  // namespace uploadguard::observability
