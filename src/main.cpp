#include "CategoryAggregator.h"
#include "CorrelationExtractor.h"
#include "DatasetLoader.h"
#include "DatasetStore.h"
#include "NetVizExceptions.h"
#include "NetVizService.h"
#include "ServiceConfig.h"
#include "TerminalUI.h"
#include <chrono>
#include <iostream>
#include <string>

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " [net.json] [options]\n"
              << "Options:\n"
              << "  --config <file>              key:value config file (applied before CLI flags)\n"
              << "  --host <addr>                Bind host (default: 0.0.0.0)\n"
              << "  --port <n>                   Bind port (default: 8201)\n"
              << "  --bind <host:port>           Bind address in one flag\n"
              << "  --threads <n>                HTTP worker threads (default: 8)\n"
              << "  --reload-interval <seconds>  Re-read the data file periodically (default: 0, off)\n"
              << "  --per-page <n>               Default listing page size (default: 25)\n"
              << "  --max-per-page <n>           Largest page size a client may request (default: 100)\n"
              << "  --summary                    Print dashboard statistics and exit\n"
              << "  --verbose                    Enable detailed logs\n"
              << "  --help                       Show this help message\n"
              << "Environment: BIND_ADDRESS, NETVIZ_DATA_PATH, NETVIZ_RELOAD_INTERVAL\n";
}

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ServiceConfig::fromArgs(argc, argv);
    } catch (const NetViz::ConfigurationException& e) {
        std::cerr << "[NetViz] " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    if (config.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    DatasetLoader::setVerbose(config.verbose);

    DatasetStore store;
    const LoadResult initial = store.reload(config.dataPath);
    if (config.verbose || config.summaryOnly) {
        TerminalUI::printLoadReport(std::cout, config.dataPath, initial);
    }

    if (config.summaryOnly) {
        const NetworkSnapshot records = store.snapshot();
        TerminalUI::printDashboard(std::cout, CategoryAggregator::summarize(*records));
        TerminalUI::printPrefixChart(std::cout,
                                     CorrelationExtractor::prefixDistribution(*records,
                                                                              config.prefixChartLimit,
                                                                              config.chartLabelChars));
        return initial.ok() ? 0 : 1;
    }

    PeriodicReloader reloader(store, config.dataPath, std::chrono::seconds(config.reloadIntervalSeconds));
    reloader.start();

    RequestMonitor monitor;
    NetVizService service(store, monitor, config);
    const int rc = service.start();
    reloader.stop();
    return rc;
}
