#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iomanip>
#include <ios>
#include <ostream>

namespace {
// setw pads by bytes; pad by code points so non-ASCII names line up.
std::string padRight(const std::string& text, size_t width) {
    const size_t len = CommonUtils::utf8Length(text);
    return len >= width ? text : text + std::string(width - len, ' ');
}
}

void TerminalUI::printLoadReport(std::ostream& out, const std::string& path, const LoadResult& result) {
    out << "\n[NetViz] Source: " << path << "\n";
    if (result.diagnostic) {
        out << "        -> " << result.diagnostic->describe() << "\n";
    }
    out << "        -> Networks loaded: " << result.records->size()
        << " | Dropped records: " << result.droppedCount << "\n";
}

void TerminalUI::printCategoryTable(std::ostream& out, const std::string& title, const CategoryCounts& counts) {
    size_t maxNameLen = 15;
    for (const auto& c : counts) maxNameLen = std::max(maxNameLen, CommonUtils::utf8Length(c.value));
    const size_t w = maxNameLen + 2;
    const size_t total = CategoryAggregator::totalCount(counts);

    const std::ios_base::fmtflags savedFlags = out.flags();
    const std::streamsize savedPrecision = out.precision();

    out << "\n" << title << "\n";
    out << padRight("Value", w) << std::right << std::setw(10) << "Count" << std::setw(10) << "Share" << "\n";
    out << std::string(w + 20, '-') << "\n";
    for (const auto& c : CategoryAggregator::sortedByFrequency(counts)) {
        const double share = total > 0 ? 100.0 * static_cast<double>(c.count) / static_cast<double>(total) : 0.0;
        out << padRight(c.value, w)
            << std::right << std::setw(10) << c.count
            << std::setw(9) << std::fixed << std::setprecision(1) << share << "%\n";
    }
    if (counts.empty()) {
        out << "        -> No records carry this field.\n";
    }
    out.flags(savedFlags);
    out.precision(savedPrecision);
}

void TerminalUI::printDashboard(std::ostream& out, const DashboardStats& stats) {
    out << "\n============================================ NETWORK SUMMARY ============================================\n";
    out << "Total networks: " << stats.totalNetworks << "\n";
    printCategoryTable(out, "[Network Types] info_type", stats.networkTypes);
    printCategoryTable(out, "[Peering Policy] policy_general", stats.policyTypes);
    printCategoryTable(out, "[Geographic Scope] info_scope", stats.scopes);
    out << "=========================================================================================================\n";
}

void TerminalUI::printPrefixChart(std::ostream& out, const PrefixDistribution& distribution) {
    out << "\n[Prefix Distribution] first " << distribution.networks.size() << " network(s) announcing both families\n";
    size_t maxNameLen = 15;
    for (const auto& name : distribution.networks) maxNameLen = std::max(maxNameLen, CommonUtils::utf8Length(name));
    const size_t w = maxNameLen + 2;
    out << padRight("Network", w) << std::right << std::setw(12) << "IPv4" << std::setw(12) << "IPv6" << "\n";
    for (size_t i = 0; i < distribution.networks.size(); ++i) {
        out << padRight(distribution.networks[i], w)
            << std::right << std::setw(12) << distribution.ipv4[i]
            << std::setw(12) << distribution.ipv6[i] << "\n";
    }
}
