#include "ServiceConfig.h"

#include "CommonUtils.h"
#include "NetVizExceptions.h"

#include <cstdlib>
#include <fstream>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw NetViz::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const NetViz::NetVizException&) {
        throw;
    } catch (const std::exception& ex) {
        throw NetViz::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        CommonUtils::trim(value),
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw NetViz::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, int minValue) {
    return static_cast<size_t>(parseIntStrict(value, key, minValue));
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw NetViz::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    for (char& c : out) {
        if (c == '-') c = '_';
    }
    return out;
}

// host:port, [v6-host]:port, or a bare port.
void applyBindAddress(ServiceConfig& config, const std::string& raw, const std::string& key) {
    const std::string value = CommonUtils::trim(raw);
    const size_t colon = value.rfind(':');
    if (colon == std::string::npos) {
        config.port = parseIntStrict(value, key, 1);
        return;
    }
    std::string host = value.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        throw NetViz::ConfigurationException(key + " is missing a host: " + value);
    }
    config.host = host;
    config.port = parseIntStrict(value.substr(colon + 1), key, 1);
}

void assignKeyValue(ServiceConfig& config, const std::string& key, const std::string& value) {
    if (key == "bind_address") {
        applyBindAddress(config, value, key);
        return;
    }

    struct IntRule {
        int ServiceConfig::*member;
        int minValue;
    };
    struct SizeRule {
        size_t ServiceConfig::*member;
        int minValue;
    };

    static const std::unordered_map<std::string, std::string ServiceConfig::*> stringFields = {
        {"data_path", &ServiceConfig::dataPath},
        {"dataset", &ServiceConfig::dataPath},
        {"host", &ServiceConfig::host}
    };
    static const std::unordered_map<std::string, bool ServiceConfig::*> boolFields = {
        {"verbose", &ServiceConfig::verbose},
        {"summary", &ServiceConfig::summaryOnly}
    };
    static const std::unordered_map<std::string, IntRule> intFields = {
        {"port", {&ServiceConfig::port, 1}},
        {"reload_interval", {&ServiceConfig::reloadIntervalSeconds, 0}},
        {"default_per_page", {&ServiceConfig::defaultPerPage, 1}},
        {"max_per_page", {&ServiceConfig::maxPerPage, 1}}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"threads", {&ServiceConfig::threads, 1}},
        {"recent_networks", {&ServiceConfig::recentNetworks, 0}},
        {"prefix_chart_limit", {&ServiceConfig::prefixChartLimit, 0}},
        {"chart_label_chars", {&ServiceConfig::chartLabelChars, 1}}
    };

    if (auto it = stringFields.find(key); it != stringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = intFields.find(key); it != intFields.end()) {
        config.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }
    throw NetViz::ConfigurationException("Unknown config key: " + key);
}

// File entries over base; the caller validates once every source is applied.
ServiceConfig mergeFile(const std::string& configPath, const ServiceConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw NetViz::ConfigurationException("Could not open config file: " + configPath);

    ServiceConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const NetViz::NetVizException& ex) {
            throw NetViz::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}
} // namespace

ServiceConfig::EnvLookup ServiceConfig::processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    };
}

void ServiceConfig::applyEnvironment(ServiceConfig& config, const EnvLookup& env) {
    if (!env) return;
    if (auto bind = env("BIND_ADDRESS")) {
        applyBindAddress(config, *bind, "BIND_ADDRESS");
    }
    if (auto path = env("NETVIZ_DATA_PATH")) {
        config.dataPath = *path;
    }
    if (auto interval = env("NETVIZ_RELOAD_INTERVAL")) {
        config.reloadIntervalSeconds = parseIntStrict(*interval, "NETVIZ_RELOAD_INTERVAL", 0);
    }
}

ServiceConfig ServiceConfig::fromFile(const std::string& configPath, const ServiceConfig& base) {
    ServiceConfig config = mergeFile(configPath, base);
    config.validate();
    return config;
}

ServiceConfig ServiceConfig::fromArgs(int argc, char* argv[], const EnvLookup& env) {
    ServiceConfig config;
    applyEnvironment(config, env);

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) throw NetViz::ConfigurationException("--config expects a path");
            configPath = argv[++i];
        }
    }
    if (!configPath.empty()) {
        config = mergeFile(configPath, config);
    }

    auto requireValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw NetViz::ConfigurationException(flag + " expects a value");
        }
        return argv[++i];
    };

    bool positionalSeen = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--host") {
            config.host = requireValue(i, arg);
        } else if (arg == "--port") {
            config.port = parseIntStrict(requireValue(i, arg), arg, 1);
        } else if (arg == "--bind") {
            applyBindAddress(config, requireValue(i, arg), arg);
        } else if (arg == "--threads") {
            config.threads = parseSizeStrict(requireValue(i, arg), arg, 1);
        } else if (arg == "--reload-interval") {
            config.reloadIntervalSeconds = parseIntStrict(requireValue(i, arg), arg, 0);
        } else if (arg == "--per-page") {
            config.defaultPerPage = parseIntStrict(requireValue(i, arg), arg, 1);
        } else if (arg == "--max-per-page") {
            config.maxPerPage = parseIntStrict(requireValue(i, arg), arg, 1);
        } else if (arg == "--summary") {
            config.summaryOnly = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw NetViz::ConfigurationException("Unknown option: " + arg);
        } else if (!positionalSeen) {
            config.dataPath = arg;
            positionalSeen = true;
        } else {
            throw NetViz::ConfigurationException("Unexpected argument: " + arg);
        }
    }

    config.validate();
    return config;
}

void ServiceConfig::validate() const {
    if (dataPath.empty()) {
        throw NetViz::ConfigurationException("data path is required");
    }
    if (host.empty()) {
        throw NetViz::ConfigurationException("host must not be empty");
    }
    if (port < 1 || port > 65535) {
        throw NetViz::ConfigurationException("port must be within [1, 65535]");
    }
    if (threads == 0) {
        throw NetViz::ConfigurationException("threads must be >= 1");
    }
    if (reloadIntervalSeconds < 0) {
        throw NetViz::ConfigurationException("reload_interval must be >= 0");
    }
    if (maxPerPage < 1 || defaultPerPage < 1) {
        throw NetViz::ConfigurationException("default_per_page and max_per_page must be >= 1");
    }
    if (defaultPerPage > maxPerPage) {
        throw NetViz::ConfigurationException("default_per_page must not exceed max_per_page");
    }
    if (chartLabelChars == 0) {
        throw NetViz::ConfigurationException("chart_label_chars must be >= 1");
    }
}
