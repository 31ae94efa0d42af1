#pragma once

#include "logger.hh"
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace entiform::driver {

/// What the tool does with the input document
enum class RunMode {
    Decode,     // external → entity, print the entity
    Encode,     // decode, then encode, print the external form
    Roundtrip,  // decode, encode, decode; compare both entities
    Validate    // print every field error
};

const char* run_mode_name(RunMode mode);

/// Driver configuration
struct CliOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::filesystem::path schema_file;               // positional
    std::filesystem::path input_file;                // -i, --input
    std::filesystem::path output_file;               // -o, --output (stdout when empty)

    // ========================================================================
    // Conversion
    // ========================================================================

    std::string entity_name;                         // -e, --entity
    RunMode mode = RunMode::Decode;                  // -m, --mode
    std::string serializer_name = "json";            // -s, --serializer
    std::vector<std::string> fields;                 // --fields a,b
    std::set<std::string> groups;                    // --group
    std::set<std::string> groups_exclude;            // --exclude-group
    bool strict = false;                             // --strict

    // ========================================================================
    // Listing
    // ========================================================================

    bool list_entities = false;                      // --list-entities

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CliOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print registered Serializers
void print_serializers();

}  // namespace entiform::driver
