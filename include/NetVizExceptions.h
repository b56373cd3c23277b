#ifndef NETVIZ_EXCEPTIONS_H
#define NETVIZ_EXCEPTIONS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace NetViz {

class NetVizException : public std::runtime_error {
public:
    explicit NetVizException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public NetVizException {
public:
    explicit IOException(const std::string& message) : NetVizException("IO Error: " + message) {}
};

class JsonParseException : public NetVizException {
public:
    JsonParseException(const std::string& message, size_t offset)
        : NetVizException("JSON Error: " + message + " at offset " + std::to_string(offset)),
          detail_(message),
          offset_(offset) {}

    const std::string& detail() const noexcept { return detail_; }
    size_t offset() const noexcept { return offset_; }

private:
    std::string detail_;
    size_t offset_;
};

class ConfigurationException : public NetVizException {
public:
    explicit ConfigurationException(const std::string& message) : NetVizException("Config Error: " + message) {}
};

class PreconditionException : public NetVizException {
public:
    explicit PreconditionException(const std::string& message) : NetVizException("Precondition Violated: " + message) {}
};

} // namespace NetViz

#endif // NETVIZ_EXCEPTIONS_H
