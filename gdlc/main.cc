//
// gdlc - GDL to TypeScript compiler
//

#include <iostream>
#include <string>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace gdl::driver;

    try {
        // Parse command-line options (handles --help and --version automatically)
        CompilerOptions opts = parse_command_line(argc, argv);

        // Create logger based on verbosity options
        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose == 1) log_level = LogLevel::Verbose;
        if (opts.verbose > 1) log_level = LogLevel::Debug;

        Logger logger(log_level, opts.color);

        // Create and run compiler
        Compiler compiler(opts, logger);
        return compiler.compile();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
