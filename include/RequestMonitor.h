#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t errorRequests = 0;
    double averageLatencyMs = 0.0;
    std::map<std::string, uint64_t> requestsByEndpoint;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void countEndpoint(const std::string& endpoint);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalLatencyMicros{0};

    mutable std::mutex endpointMutex;
    std::map<std::string, uint64_t> endpointCounts;
};
