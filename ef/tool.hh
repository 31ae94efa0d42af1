#pragma once

#include "cli_options.hh"
#include "logger.hh"
#include <entiform/convert.hh>
#include <entiform/schema_registry.hh>
#include <entiform/value.hh>

namespace entiform::driver {

/// Command line driver: schema document in, converted document out
class Tool {
public:
    Tool(const CliOptions& options, Logger& logger);

    /// Returns 0 on success, non-zero on error
    int run();

private:
    // ========================================================================
    // Modes
    // ========================================================================

    int run_decode(const schema& s, const value& input);
    int run_encode(const schema& s, const value& input);
    int run_roundtrip(const schema& s, const value& input);
    int run_validate(const schema& s, const value& input);

    // ========================================================================
    // Utility Methods
    // ========================================================================

    int list_entities();
    void warn_hidden_fields(const schema& s);
    void warn_unknown_keys(const schema& s, const value& input);
    [[nodiscard]] convert_options make_convert_options() const;
    [[nodiscard]] context make_context();
    void write_output(const value& v);

    // ========================================================================
    // State
    // ========================================================================

    const CliOptions& options_;
    Logger& logger_;
    SchemaRegistry schemas_;
    std::vector<std::string> entities_;
};

}  // namespace entiform::driver
