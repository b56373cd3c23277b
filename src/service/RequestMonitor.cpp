#include "RequestMonitor.h"

#include <algorithm>
#include <cmath>

namespace {
long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}
} // namespace

void RequestMonitor::countEndpoint(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(endpointMutex);
    endpointCounts[endpoint] += 1;
}

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
    countEndpoint(endpoint);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
    countEndpoint(endpoint);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }

    std::lock_guard<std::mutex> lock(endpointMutex);
    out.requestsByEndpoint = endpointCounts;
    return out;
}
