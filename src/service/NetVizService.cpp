#include "NetVizService.h"

#include "CategoryAggregator.h"
#include "CorrelationExtractor.h"
#include "JsonUtils.h"
#include "NetVizExceptions.h"
#include "NetworkFilter.h"
#include "Paginator.h"
#include "QueryParams.h"
#include "ResponseJson.h"
#include "SearchFilter.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

void setJsonResponse(httplib::Response& response, int status, const std::string& payload) {
    response.status = status;
    response.set_content(payload, "application/json");
}

void logMonitoringLine(const std::string& endpoint, int status, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[NetVizService][Monitor] endpoint=" << endpoint
         << " status=" << status
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs;
    std::cout << line.str() << "\n";
}

std::string param(const httplib::Request& request, const char* name) {
    return request.has_param(name) ? request.get_param_value(name) : std::string();
}

using Handler = std::function<std::string(const httplib::Request&, const NetworkCollection&)>;
} // namespace

NetVizService::NetVizService(DatasetStore& storeRef, RequestMonitor& monitorRef, ServiceConfig configValue)
    : store(storeRef), monitor(monitorRef), config(std::move(configValue)) {}

int NetVizService::start() {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threads)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    // Every route reads one snapshot for the whole request.
    auto route = [this, &server](const std::string& endpoint, Handler handler) {
        server.Get(endpoint, [this, endpoint, handler](const httplib::Request& request, httplib::Response& response) {
            const auto started = Clock::now();
            int status = 200;
            try {
                const NetworkSnapshot records = store.snapshot();
                const std::string payload = handler(request, *records);
                const double latencyMs = elapsedMs(started);
                monitor.recordSuccess(endpoint, latencyMs);
                setJsonResponse(response, status, payload);
            } catch (const NetViz::PreconditionException& e) {
                status = 400;
                const double latencyMs = elapsedMs(started);
                monitor.recordError(endpoint, latencyMs);
                setJsonResponse(response, status, ResponseJson::error(e.what(), latencyMs));
            } catch (const std::exception& e) {
                status = 500;
                const double latencyMs = elapsedMs(started);
                monitor.recordError(endpoint, latencyMs);
                std::cerr << "[NetVizService] endpoint=" << endpoint << " error=" << e.what() << "\n";
                setJsonResponse(response, status, ResponseJson::error("Internal error", latencyMs));
            }
            logMonitoringLine(endpoint, status, elapsedMs(started), monitor.snapshot());
        });
    };

    route("/api/stats", [this](const httplib::Request&, const NetworkCollection& records) {
        const DashboardStats stats = CategoryAggregator::summarize(records);
        const size_t n = std::min(config.recentNetworks, records.size());
        const std::vector<NetworkRecord> recent(records.begin(), records.begin() + static_cast<std::ptrdiff_t>(n));
        return ResponseJson::dashboard(stats, recent);
    });

    route("/api/networks", [this](const httplib::Request& request, const NetworkCollection& records) {
        NetworkCriteria criteria;
        criteria.text = QueryParams::text(param(request, "q"));
        criteria.type = QueryParams::text(param(request, "type"));
        criteria.policy = QueryParams::text(param(request, "policy"));
        criteria.status = QueryParams::text(param(request, "status"));

        const PageRequest requested = Paginator::normalize(QueryParams::integer(param(request, "page"), "page"),
                                                             QueryParams::integer(param(request, "per_page"), "per_page"),
                                                             config.defaultPerPage,
                                                             config.maxPerPage);
        const std::vector<NetworkRecord> filtered = NetworkFilter::apply(records, criteria);
        const PageRequest pageRequest = Paginator::clampToLastPage(requested, filtered.size());
        const Page<NetworkRecord> page = Paginator::paginate(filtered, pageRequest.page, pageRequest.perPage);
        return ResponseJson::networkPage(page, criteria);
    });

    route("/api/search", [](const httplib::Request& request, const NetworkCollection& records) {
        SearchQuery query;
        query.asn = QueryParams::integer(param(request, "asn"), "asn");
        query.name = QueryParams::text(param(request, "name"));
        return ResponseJson::searchResults(SearchFilter::search(records, query), query);
    });

    route("/api/network-types", [](const httplib::Request&, const NetworkCollection& records) {
        return ResponseJson::countsChart(CategoryAggregator::countBy(records, CategoryField::INFO_TYPE));
    });

    route("/api/prefixes-distribution", [this](const httplib::Request&, const NetworkCollection& records) {
        return ResponseJson::prefixDistribution(
            CorrelationExtractor::prefixDistribution(records, config.prefixChartLimit, config.chartLabelChars));
    });

    route("/api/ix-facility-correlation", [](const httplib::Request&, const NetworkCollection& records) {
        return ResponseJson::correlation(CorrelationExtractor::extractPairs(
            records, MetricField::IX_COUNT, MetricField::FAC_COUNT, LabelField::NAME));
    });

    route("/api/categories", [](const httplib::Request& request, const NetworkCollection& records) {
        const std::string name = param(request, "field");
        const std::optional<CategoryField> field = RecordFields::parseCategoryField(name);
        if (!field) {
            throw NetViz::PreconditionException("Unknown category field: " + name);
        }
        return ResponseJson::countsChart(CategoryAggregator::countBy(records, *field));
    });

    route("/api/correlation", [](const httplib::Request& request, const NetworkCollection& records) {
        const std::optional<MetricField> x = RecordFields::parseMetricField(param(request, "x"));
        const std::optional<MetricField> y = RecordFields::parseMetricField(param(request, "y"));
        const std::string labelName = param(request, "label");
        const std::optional<LabelField> label =
            labelName.empty() ? std::optional<LabelField>(LabelField::NAME) : RecordFields::parseLabelField(labelName);
        if (!x || !y || !label) {
            throw NetViz::PreconditionException("x and y must name numeric fields, label must be name or aka");
        }
        return ResponseJson::correlation(CorrelationExtractor::extractPairs(records, *x, *y, *label));
    });

    route("/healthz", [this](const httplib::Request&, const NetworkCollection& records) {
        const MonitoringSnapshot snapshot = monitor.snapshot();
        std::ostringstream out;
        out << "{"
            << "\"networks\":" << records.size() << ","
            << "\"generation\":" << store.generation() << ","
            << "\"total_requests\":" << snapshot.totalRequests << ","
            << "\"errors\":" << snapshot.errorRequests << ","
            << "\"avg_latency_ms\":" << JsonUtils::formatDouble(snapshot.averageLatencyMs)
            << "}";
        return out.str();
    });

    std::cout << "[NetVizService] networks=" << store.snapshot()->size()
              << " host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threads)
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[NetVizService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
