#ifndef BOARD_PROFILE_HPP
#define BOARD_PROFILE_HPP

#include <string>
#include <vector>

namespace Board {

    struct PayloadArtifact {
        std::string description;
        std::string sourcePath;
        std::string destinationName;
    };

    struct ImageSpec {
        std::string description;
        std::string imageName;
        std::string destinationName;
    };

    struct BoardProfile {
        std::string name;
        std::string displayName;
        std::string bootloader;
        std::string defconfig;
        std::string volumeLabel;
        std::string defaultSize;
        // First entry is the first-stage loader, second the main image.
        std::vector<ImageSpec> images;
    };

    extern const std::string DEFAULT_IMAGES_DIR;

    // BeagleBone Black running barebox (am335x_evm).
    BoardProfile beagleBoneBlack();

    std::vector<PayloadArtifact> resolveArtifacts(const BoardProfile& profile,
                                                  const std::string& imagesDir);
}

#endif // BOARD_PROFILE_HPP
