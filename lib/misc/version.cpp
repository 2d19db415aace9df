#include "misc/version.hpp"
#include "utils/colors.hpp"
#include <iostream>

namespace Version {
    const std::string PROGRAM = "bootcard";
    const std::string VERSION = "1.0.0";
    const std::string LICENSE = "Open Source Project";

    void printVersion() {
        std::cout << Colors::bold(PROGRAM) << " v" << VERSION << std::endl;
        std::cout << "License: " << LICENSE << std::endl;
    }

    void printBanner() {
        std::cout << Colors::bold(PROGRAM) << " v" << VERSION << " - ";
        std::cout << "Bootable SD card provisioning" << std::endl;
        std::cout << std::endl;
    }
}
