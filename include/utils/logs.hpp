#ifndef LOGS_HPP
#define LOGS_HPP

#include <ostream>
#include <string>
#include <vector>

namespace Logs {
    void info(const std::string& message);
    void success(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    // Printed only in verbose mode.
    void debug(const std::string& message);

    // Verbose-mode echo of an external command, shell `set -x` style.
    void command(const std::vector<std::string>& argv);

    void setVerbose(bool verbose);
    bool isVerbose();

    // Redirects regular and error output; used by tests to capture logs.
    void setStreams(std::ostream& out, std::ostream& err);
    void resetStreams();

    std::string joinCommand(const std::vector<std::string>& argv);
}

#endif // LOGS_HPP
