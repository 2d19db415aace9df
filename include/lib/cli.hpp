#ifndef CLI_HPP
#define CLI_HPP

#include "lib/board_profile.hpp"
#include <ostream>
#include <string>

namespace Cli {

    struct Options {
        std::string device;
        std::string sizeExpression;
        std::string imagesDir;
        bool verbose = false;
    };

    enum class ParseResult {
        RUN,
        EXIT_SUCCESS_REQUESTED,
        INVALID
    };

    void printUsage(std::ostream& out, const std::string& program, const Board::BoardProfile& board);

    // Help and version are printed here and reported as EXIT_SUCCESS_REQUESTED.
    ParseResult parseArguments(int argc, char* argv[], const Board::BoardProfile& board, Options& opts);
}

#endif // CLI_HPP
