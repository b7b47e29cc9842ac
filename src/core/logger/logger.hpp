#pragma once
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace Folio {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_INFO    = 1 << 0,
    LOG_WARN    = 1 << 1,
    LOG_ERROR   = 1 << 2,
    LOG_SUCCESS = 1 << 3,
    LOG_DEBUG   = 1 << 4,
    LOG_ALL     = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS,
    LOG_VERBOSE = LOG_ALL | LOG_DEBUG
};

class Logger {
public:
    explicit Logger(int level = LOG_ALL);
    Logger(int level, std::ostream& out, std::ostream& err, bool colors = false);

    void set_level(int level);
    int  level() const;
    void set_prefix(const std::string& prefix);

    void info(const std::string& message);
    void success(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void debug(const std::string& message);

    // Untagged line on the out stream, still subject to LOG_INFO.
    void plain(const std::string& message);

private:
    void write(int level, std::ostream& stream, const char* color, const char* tag,
               const std::string& message);

    int               level_;
    std::ostream&     out_;
    std::ostream&     err_;
    bool              colors_;
    std::string       prefix_;
    mutable std::mutex mutex_;
};

using LoggerPtr = std::shared_ptr<Logger>;

}  // namespace Core
}  // namespace Folio
