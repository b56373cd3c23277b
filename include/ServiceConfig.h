#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

struct ServiceConfig {
    std::string dataPath = "data/peeringdb/net.json";
    std::string host = "0.0.0.0";
    int port = 8201;
    size_t threads = 8;
    // 0 disables periodic reloads of dataPath.
    int reloadIntervalSeconds = 0;

    int defaultPerPage = 25;
    int maxPerPage = 100;
    size_t recentNetworks = 10;
    size_t prefixChartLimit = 15;
    size_t chartLabelChars = 30;

    bool summaryOnly = false;
    bool verbose = false;
    bool showHelp = false;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Builds config from defaults, environment, optional --config file and CLI flags.
     * @details Later sources win: defaults < environment < config file < CLI.
     * @post Returns a validated config object (unless --help was requested).
     * @throws NetViz::ConfigurationException on invalid arguments or values.
     */
    static ServiceConfig fromArgs(int argc, char* argv[], const EnvLookup& env = processEnvironment());

    /**
     * @brief Loads values from a key:value file (loose YAML/JSON-ish).
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws NetViz::ConfigurationException on parse/validation failures.
     */
    static ServiceConfig fromFile(const std::string& configPath, const ServiceConfig& base);

    // BIND_ADDRESS=host:port, NETVIZ_DATA_PATH, NETVIZ_RELOAD_INTERVAL.
    static void applyEnvironment(ServiceConfig& config, const EnvLookup& env);

    static EnvLookup processEnvironment();

    void validate() const;
};
