#include <iostream>

#include "cli_options.hh"
#include "logger.hh"
#include "tool.hh"

int main(int argc, char* argv[]) {
    using namespace entiform::driver;

    try {
        // Handles --help, --version, --list-serializers
        CliOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;

        Logger logger(log_level, opts.color);

        Tool tool(opts, logger);
        return tool.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
