#include "cli_options.hh"
#include <entiform/serializer_registry.hh>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace entiform::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && std::strcmp(arg, short_name) == 0) ||
           (long_name && std::strcmp(arg, long_name) == 0);
}

// Accepts "--name value" and "--name=value"
static bool take_value(int argc, char** argv, int& i, const char* short_name,
                       const char* long_name, std::string& out) {
    const char* arg = argv[i];

    if (long_name) {
        size_t len = std::strlen(long_name);
        if (std::strncmp(arg, long_name, len) == 0 && arg[len] == '=') {
            out = arg + len + 1;
            if (out.empty()) {
                throw std::runtime_error(std::string("Option ") + long_name + " requires argument");
            }
            return true;
        }
    }

    if (!is_flag(arg, short_name, long_name)) {
        return false;
    }
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Option ") + arg + " requires argument");
    }
    out = argv[++i];
    return true;
}

static std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

static RunMode parse_mode(const std::string& name) {
    if (name == "decode") return RunMode::Decode;
    if (name == "encode") return RunMode::Encode;
    if (name == "roundtrip") return RunMode::Roundtrip;
    if (name == "validate") return RunMode::Validate;
    throw std::runtime_error(
        "Invalid mode: " + name + "\nValid modes: decode, encode, roundtrip, validate"
    );
}

static ColorMode parse_color(const std::string& name) {
    if (name == "auto") return ColorMode::Auto;
    if (name == "always") return ColorMode::Always;
    if (name == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid color mode: " + name + " (expected: auto, always, never)");
}

const char* run_mode_name(RunMode mode) {
    switch (mode) {
        case RunMode::Decode: return "decode";
        case RunMode::Encode: return "encode";
        case RunMode::Roundtrip: return "roundtrip";
        case RunMode::Validate: return "validate";
    }
    return "unknown";
}

// ============================================================================
// Main Parser
// ============================================================================

CliOptions parse_command_line(int argc, char** argv) {
    CliOptions opts;
    auto& registry = SerializerRegistry::instance();

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (is_flag(arg, "-h", "--help")) {
            print_help(argv[0]);
            std::exit(0);
        }

        if (is_flag(arg, nullptr, "--version")) {
            print_version();
            std::exit(0);
        }

        if (is_flag(arg, nullptr, "--list-serializers")) {
            print_serializers();
            std::exit(0);
        }

        if (is_flag(arg, nullptr, "--list-entities")) {
            opts.list_entities = true;
            continue;
        }

        // Verbosity
        if (is_flag(arg, "-v", "--verbose")) {
            opts.verbose = true;
            continue;
        }

        if (is_flag(arg, "-q", "--quiet")) {
            opts.quiet = true;
            continue;
        }

        if (take_value(argc, argv, i, nullptr, "--color", value)) {
            opts.color = parse_color(value);
            continue;
        }

        // Input/Output
        if (take_value(argc, argv, i, "-i", "--input", value)) {
            opts.input_file = value;
            continue;
        }

        if (take_value(argc, argv, i, "-o", "--output", value)) {
            opts.output_file = value;
            continue;
        }

        // Conversion
        if (take_value(argc, argv, i, "-e", "--entity", value)) {
            opts.entity_name = value;
            continue;
        }

        if (take_value(argc, argv, i, "-m", "--mode", value)) {
            opts.mode = parse_mode(value);
            continue;
        }

        if (take_value(argc, argv, i, "-s", "--serializer", value)) {
            opts.serializer_name = value;
            continue;
        }

        if (take_value(argc, argv, i, nullptr, "--fields", value)) {
            auto names = split_list(value);
            opts.fields.insert(opts.fields.end(), names.begin(), names.end());
            continue;
        }

        if (take_value(argc, argv, i, nullptr, "--group", value)) {
            opts.groups.insert(value);
            continue;
        }

        if (take_value(argc, argv, i, nullptr, "--exclude-group", value)) {
            opts.groups_exclude.insert(value);
            continue;
        }

        if (is_flag(arg, nullptr, "--strict")) {
            opts.strict = true;
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        if (!opts.schema_file.empty()) {
            throw std::runtime_error(std::string("Only one schema file may be given: ") + arg);
        }
        opts.schema_file = arg;
    }

    // Validation
    if (opts.schema_file.empty()) {
        throw std::runtime_error("No schema file specified");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (opts.list_entities) {
        return opts;
    }

    if (opts.entity_name.empty()) {
        throw std::runtime_error("No entity specified (use -e <name>)");
    }

    if (opts.input_file.empty()) {
        throw std::runtime_error("No input document specified (use -i <file>)");
    }

    if (!opts.fields.empty() && opts.mode == RunMode::Roundtrip) {
        throw std::runtime_error("--fields cannot be combined with --mode roundtrip");
    }

    if (!registry.has_serializer(opts.serializer_name)) {
        auto available = registry.get_available_serializers();
        std::string error_msg = "Unknown serializer: " + opts.serializer_name;

        if (!available.empty()) {
            error_msg += "\n\nAvailable serializers:";
            for (const auto& name : available) {
                error_msg += "\n  - " + name;
            }
        }

        error_msg += "\n\nUse --list-serializers for more details.";
        throw std::runtime_error(error_msg);
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <schema.yaml>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-serializers      List registered serializers\n";
    std::cout << "  --list-entities         List the entities of the schema document\n";
    std::cout << "\n";

    std::cout << "Input/Output:\n";
    std::cout << "  -i, --input <file>      Input document (JSON or YAML)\n";
    std::cout << "  -o, --output <file>     Output file (default: stdout)\n";
    std::cout << "\n";

    std::cout << "Conversion:\n";
    std::cout << "  -e, --entity <name>     Entity to convert\n";
    std::cout << "  -m, --mode <mode>       decode, encode, roundtrip or validate (default: decode)\n";
    std::cout << "  -s, --serializer <name> Serializer (default: json)\n";
    std::cout << "  --fields <a,b,...>      Convert only the named fields\n";
    std::cout << "  --group <name>          Convert only fields of this group (repeatable)\n";
    std::cout << "  --exclude-group <name>  Skip fields of this group (repeatable)\n";
    std::cout << "  --strict                Disable loose coercions (\"12\" -> 12)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color <when>          auto, always or never (default: auto)\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --list-entities shop.yaml\n";
    std::cout << "  " << program_name << " -e Product -i product.json shop.yaml\n";
    std::cout << "  " << program_name << " -e Product -i product.json -m validate shop.yaml\n";
    std::cout << "  " << program_name << " -e Product -i patch.json --fields price shop.yaml\n";
}

void print_version() {
    std::cout << "entiform v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_serializers() {
    auto& registry = SerializerRegistry::instance();

    std::cout << "Available serializers:\n\n";
    for (const auto& name : registry.get_available_serializers()) {
        std::cout << "  " << name << "\n";
    }
}

}  // namespace entiform::driver
