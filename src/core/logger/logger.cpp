#include "logger.hpp"
#include <unistd.h>

namespace Folio {
namespace Core {

namespace {
const char* RESET  = "\033[0m";
const char* RED    = "\033[31m";
const char* GREEN  = "\033[32m";
const char* YELLOW = "\033[33m";
const char* BLUE   = "\033[34m";
const char* GRAY   = "\033[90m";
}  // namespace

Logger::Logger(int level)
    : level_(level), out_(std::cout), err_(std::cerr), colors_(isatty(STDOUT_FILENO) != 0) {
}

Logger::Logger(int level, std::ostream& out, std::ostream& err, bool colors)
    : level_(level), out_(out), err_(err), colors_(colors) {
}

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    prefix_ = prefix;
}

void Logger::write(int level, std::ostream& stream, const char* color, const char* tag,
                   const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;
    if (colors_)
        stream << color << tag << RESET << " " << prefix_ << message << std::endl;
    else
        stream << tag << " " << prefix_ << message << std::endl;
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, out_, BLUE, "[INFO]", message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, out_, GREEN, "[SUCCESS]", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, err_, YELLOW, "[WARN]", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, err_, RED, "[ERROR]", message);
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, out_, GRAY, "[DEBUG]", message);
}

void Logger::plain(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LOG_INFO)
        out_ << message << std::endl;
}

}  // namespace Core
}  // namespace Folio
