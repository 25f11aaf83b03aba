// filename: logging.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include <iosfwd>
#include <string>

namespace oceanparse {

/**
 * @brief Sink for recoverable conditions met while assembling archives.
 */
struct Logger {
    virtual ~Logger() = default;
    virtual void error(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void info(const std::string& message) { (void)message; }
};

class StreamLogger : public Logger {
public:
    StreamLogger();
    StreamLogger(std::ostream& out, std::ostream& err, bool quiet);

    void error(const std::string& message) override;
    void warning(const std::string& message) override;
    void info(const std::string& message) override;


private:
    std::ostream* out_;
    std::ostream* err_;
    bool quiet_{false};
};

// Process-wide fallback used when callers do not provide a logger.
Logger& defaultLogger();

}  // namespace oceanparse
