#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace entiform::driver {

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
    , color_mode_(color)
{
    switch (color_mode_) {
        case ColorMode::Always:
            std::cout << termcolor::colorize;
            std::cerr << termcolor::colorize;
            break;
        case ColorMode::Never:
            std::cout << termcolor::nocolorize;
            std::cerr << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    std::cerr << termcolor::bold << termcolor::red
              << "error: " << termcolor::reset
              << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::yellow
              << "warning: " << termcolor::reset
              << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::green
              << "ok: " << termcolor::reset
              << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    std::cerr << termcolor::cyan << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    std::cerr << termcolor::magenta << "[debug] " << termcolor::reset
              << message << "\n";
}

void Logger::field_error(const std::string& path, const std::string& message, const std::string& code) {
    std::cerr << "  " << termcolor::bold << (path.empty() ? "<root>" : path) << termcolor::reset
              << ": " << message << " "
              << termcolor::grey << "[" << code << "]" << termcolor::reset << "\n";
}

void Logger::mismatch(const std::string& label, const std::string& rendering) {
    std::cerr << "  " << termcolor::yellow << label << termcolor::reset
              << " " << rendering << "\n";
}

void Logger::entity_heading(const std::string& name, std::size_t field_count) {
    std::cout << termcolor::bold << name << termcolor::reset
              << " (" << field_count << (field_count == 1 ? " field)" : " fields)") << "\n";
}

void Logger::field_line(const std::string& description) {
    std::cout << "  - " << description << "\n";
}

void Logger::result(const std::string& document) {
    std::cout << document;
    if (!document.empty() && document.back() != '\n') {
        std::cout << "\n";
    }
    std::cout.flush();
}

} // namespace entiform::driver
