#include "lib/cli.hpp"
#include "lib/errors.hpp"
#include "lib/platform.hpp"
#include "lib/prompt.hpp"
#include "lib/session.hpp"
#include "utils/logs.hpp"
#include "misc/version.hpp"
#include <csignal>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    Cli::Options opts;
    Session::SessionConfig config;

    try {
        switch (Cli::parseArguments(argc, argv, config.board, opts)) {
            case Cli::ParseResult::EXIT_SUCCESS_REQUESTED:
                return 0;
            case Cli::ParseResult::INVALID:
                return 1;
            case Cli::ParseResult::RUN:
                break;
        }

        Logs::setVerbose(opts.verbose);
        Version::printBanner();

        ErrorHandler::checkPrivileges();

        config.device = opts.device;
        config.sizeExpression = opts.sizeExpression;
        if (!opts.imagesDir.empty()) {
            config.imagesDir = opts.imagesDir;
        }

        Logs::info("Target Device: " + config.device);
        Logs::debug("Images directory: " + config.imagesDir);

        // A tool that exits before reading its input must not kill us.
        std::signal(SIGPIPE, SIG_IGN);

        Platform::LinuxSystem system;
        Prompt::ConsolePrompter prompter(std::cin, std::cout);
        Session::SessionController session(system, prompter, config);

        return session.run();

    } catch (const PermissionError& e) {
        Logs::fatal(e.what());
        return 1;
    } catch (const BootCardException& e) {
        Logs::fatal(ErrorHandler::kindName(e.kind()) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logs::fatal("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
