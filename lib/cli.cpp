#include "lib/cli.hpp"
#include "lib/partitioner.hpp"
#include "misc/version.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include <getopt.h>
#include <iostream>

namespace Cli {

    void printUsage(std::ostream& out, const std::string& program, const Board::BoardProfile& board) {
        out << Colors::bold("Usage:") << " " << program << " [OPTIONS] <SD_CARD_DEVICE>\n\n";
        out << "Flash the " << board.bootloader << " bootloader to an SD card for "
            << board.displayName << " standalone booting.\n\n";

        out << Colors::cyan("Arguments:") << "\n";
        out << "  SD_CARD_DEVICE        Target SD card device (e.g., /dev/sdb, /dev/mmcblk0)\n\n";

        out << Colors::cyan("Options:") << "\n";
        out << "  -h, --help            Show this help message and exit\n";
        out << "  -v, --verbose         Echo every external command before running it\n";
        out << "  -s, --size SIZE       Partition size (default: " << board.defaultSize << ")\n";
        out << "  -i, --images DIR      Directory holding the built images\n";
        out << "                        (default: " << Board::DEFAULT_IMAGES_DIR << ")\n";
        out << "      --version         Show version information\n\n";

        out << Colors::bold("Examples:") << "\n";
        out << "  " << program << " /dev/sdb                    # Flash to /dev/sdb\n";
        out << "  " << program << " --verbose /dev/mmcblk0      # Flash with verbose output\n";
        out << "  " << program << " --size +128M /dev/sdc       # Flash with 128M partition\n\n";

        out << Colors::bold("Files copied to the SD card:") << "\n";
        for (const auto& image : board.images) {
            out << "  " << image.imageName << " -> " << image.destinationName << "\n";
        }
        out << "\n";

        out << Colors::yellow("Safety: ") << "This tool will DESTROY all data on the target device!\n";
        out << Colors::yellow("Note: ") << "Requires root privileges and images built with "
            << board.defconfig << "\n";
    }

    ParseResult parseArguments(int argc, char* argv[], const Board::BoardProfile& board, Options& opts) {
        enum { VERSION_OPTION = 1000 };

        static struct option long_options[] = {
            {"help", no_argument, 0, 'h'},
            {"verbose", no_argument, 0, 'v'},
            {"size", required_argument, 0, 's'},
            {"images", required_argument, 0, 'i'},
            {"version", no_argument, 0, VERSION_OPTION},
            {0, 0, 0, 0}
        };

        const std::string program = argc > 0 ? argv[0] : Version::PROGRAM;

        // Restart getopt from scratch on every call.
        optind = 0;

        int opt;
        int option_index = 0;

        while ((opt = getopt_long(argc, argv, "hvs:i:", long_options, &option_index)) != -1) {
            switch (opt) {
                case 'h':
                    printUsage(std::cout, program, board);
                    return ParseResult::EXIT_SUCCESS_REQUESTED;
                case 'v':
                    opts.verbose = true;
                    break;
                case 's':
                    opts.sizeExpression = optarg;
                    break;
                case 'i':
                    opts.imagesDir = optarg;
                    break;
                case VERSION_OPTION:
                    Version::printVersion();
                    return ParseResult::EXIT_SUCCESS_REQUESTED;
                default:
                    printUsage(std::cerr, program, board);
                    return ParseResult::INVALID;
            }
        }

        for (int i = optind; i < argc; ++i) {
            if (!opts.device.empty()) {
                Logs::error("Multiple devices specified");
                printUsage(std::cerr, program, board);
                return ParseResult::INVALID;
            }
            opts.device = argv[i];
        }

        if (opts.device.empty()) {
            Logs::error("SD card device not specified");
            printUsage(std::cerr, program, board);
            return ParseResult::INVALID;
        }

        if (!opts.sizeExpression.empty() && !Partitioner::isValidSizeExpression(opts.sizeExpression)) {
            Logs::error("Invalid partition size: " + opts.sizeExpression + " (e.g. +64M, +1G)");
            return ParseResult::INVALID;
        }

        return ParseResult::RUN;
    }
}
