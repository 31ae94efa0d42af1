#pragma once

#include <iostream>
#include <string>

namespace entiform::driver {

enum class LogLevel {
    Quiet,   // Errors and results only
    Normal,  // + warnings, summaries
    Verbose, // + file and mode messages
    Debug    // + intermediate documents
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Driver output with termcolor colouring.
 *
 * Diagnostics (errors, warnings, field errors, unstable round trips) go to
 * stderr. Summaries, entity listings and the converted document go to
 * stdout, so that `entiform ... > out.yaml` captures only the document.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// One field_error: path in bold, code dimmed
    void field_error(const std::string& path, const std::string& message, const std::string& code);

    /// Two renderings of one entity that should have been equal
    void mismatch(const std::string& label, const std::string& rendering);

    /// Entity heading and its field lines for --list-entities
    void entity_heading(const std::string& name, std::size_t field_count);
    void field_line(const std::string& description);

    /// Converted document, printed regardless of the level
    void result(const std::string& document);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    ColorMode color_mode_;

    bool should_log(LogLevel required_level) const;
};

} // namespace entiform::driver
