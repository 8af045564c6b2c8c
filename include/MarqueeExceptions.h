#ifndef MARQUEE_EXCEPTIONS_H
#define MARQUEE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Marquee {

class MarqueeException : public std::runtime_error {
public:
    explicit MarqueeException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public MarqueeException {
public:
    explicit IOException(const std::string& message) : MarqueeException("IO Error: " + message) {}
};

class DatasetException : public MarqueeException {
public:
    explicit DatasetException(const std::string& message) : MarqueeException("Dataset Error: " + message) {}
};

// Rejected before any pipeline stage runs.
class ConfigurationException : public MarqueeException {
public:
    explicit ConfigurationException(const std::string& message) : MarqueeException("Configuration Error: " + message) {}
};

} // namespace Marquee

#endif // MARQUEE_EXCEPTIONS_H
