#include "utils/logs.hpp"
#include "utils/colors.hpp"
#include <iostream>

namespace Logs {

    namespace {
        bool verboseMode = false;
        std::ostream* outStream = &std::cout;
        std::ostream* errStream = &std::cerr;

        bool needsQuoting(const std::string& arg) {
            if (arg.empty()) return true;
            return arg.find_first_of(" \t\n'\"\\$*?") != std::string::npos;
        }
    }

    void info(const std::string& message) {
        *outStream << Colors::cyan("[INFO] ") << message << std::endl;
    }

    void success(const std::string& message) {
        *outStream << Colors::green("[SUCCESS] ") << message << std::endl;
    }

    void warning(const std::string& message) {
        *outStream << Colors::yellow("[WARNING] ") << message << std::endl;
    }

    void error(const std::string& message) {
        *errStream << Colors::red("[ERROR] ") << message << std::endl;
    }

    void fatal(const std::string& message) {
        *errStream << Colors::bold(Colors::red("[FATAL] ")) << message << std::endl;
    }

    void debug(const std::string& message) {
        if (!verboseMode) return;
        *outStream << Colors::blue("[DEBUG] ") << message << std::endl;
    }

    void command(const std::vector<std::string>& argv) {
        if (!verboseMode) return;
        *errStream << "+ " << joinCommand(argv) << std::endl;
    }

    void setVerbose(bool verbose) {
        verboseMode = verbose;
    }

    bool isVerbose() {
        return verboseMode;
    }

    void setStreams(std::ostream& out, std::ostream& err) {
        outStream = &out;
        errStream = &err;
    }

    void resetStreams() {
        outStream = &std::cout;
        errStream = &std::cerr;
    }

    std::string joinCommand(const std::vector<std::string>& argv) {
        std::string line;

        for (const auto& arg : argv) {
            if (!line.empty()) line += ' ';

            if (needsQuoting(arg)) {
                line += '\'';
                for (char c : arg) {
                    if (c == '\'') line += "'\\''";
                    else line += c;
                }
                line += '\'';
            } else {
                line += arg;
            }
        }

        return line;
    }
}
