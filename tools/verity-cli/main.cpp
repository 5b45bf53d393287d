#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <verity/cli/verity_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so that --json output on stdout stays parseable
        spdlog::set_default_logger(spdlog::stderr_color_mt("verity"));
        // Conservative default; VerityCLI adjusts it from -v and VERITY_LOG_LEVEL
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        verity::cli::VerityCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
