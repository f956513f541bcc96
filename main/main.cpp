// Core
#include "sync/Controller.hpp"
#include "sync/errors.hpp"
#include "sync/interrupt.hpp"

// Filesystems
#include "fs/Local.hpp"
#include "fs/Remote.hpp"
#include "shell/Adb.hpp"

// CLI
#include "cli/Args.hpp"
#include "cli/Usage.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <iostream>
#include <unistd.h>

#ifndef DEVSYNC_VERSION
#define DEVSYNC_VERSION "0.0.0"
#endif

using namespace ds;
using namespace ds::config;

namespace {

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_INTERRUPTED = 130;

void printUsage(std::ostream& os, const bool color) {
    auto usage = cli::devsyncUsage();
    usage.theme.enabled = color;
    os << usage.toText();
}

}

int main(int argc, char** argv) {
    cli::Options opts;
    try {
        opts = cli::parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const cli::UsageError& e) {
        std::cerr << "devsync: " << e.what() << "\n\n";
        printUsage(std::cerr, isatty(STDERR_FILENO));
        return EXIT_USAGE;
    }

    if (opts.showHelp) {
        printUsage(std::cout, opts.console.color && isatty(STDOUT_FILENO));
        return 0;
    }
    if (opts.showVersion) {
        std::cout << "devsync " << DEVSYNC_VERSION << "\n";
        return 0;
    }

    try {
        if (opts.configPath) ConfigRegistry::init(*opts.configPath);
        else ConfigRegistry::init();
        log::Registry::init(opts.console);
    } catch (const std::exception& e) {
        std::cerr << "devsync: " << e.what() << "\n";
        return EXIT_FAILED;
    }

    sync::interrupt::install();

    try {
        const auto& cnf = ConfigRegistry::get();
        cli::applyConfig(cnf, opts);

        const auto adb = std::make_shared<shell::Adb>(shell::Adb::fromConfig(cli::resolveAdb(cnf, opts)));
        sync::Controller controller(std::make_shared<fs::Local>(adb), std::make_shared<fs::Remote>(adb));

        const auto outcome = controller.run(opts.request);
        log::Registry::flushAll();
        return outcome == sync::Controller::Outcome::Success ? 0 : EXIT_FAILED;
    } catch (const sync::Interrupted&) {
        log::Registry::devsync()->warn("[!] Interrupted");
        log::Registry::flushAll();
        return EXIT_INTERRUPTED;
    } catch (const std::exception& e) {
        log::Registry::devsync()->error("[!] {}", e.what());
        log::Registry::flushAll();
        return EXIT_FAILED;
    }
}
