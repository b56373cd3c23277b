#pragma once
#include "CategoryAggregator.h"
#include "CorrelationExtractor.h"
#include "DatasetLoader.h"
#include <iosfwd>
#include <string>
#include <vector>

class TerminalUI {
public:
    static void printLoadReport(std::ostream& out, const std::string& path, const LoadResult& result);
    static void printCategoryTable(std::ostream& out, const std::string& title, const CategoryCounts& counts);
    static void printDashboard(std::ostream& out, const DashboardStats& stats);
    static void printPrefixChart(std::ostream& out, const PrefixDistribution& distribution);
};
