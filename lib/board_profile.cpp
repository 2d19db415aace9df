#include "lib/board_profile.hpp"
#include <filesystem>

namespace Board {

    const std::string DEFAULT_IMAGES_DIR = "./build/images";

    BoardProfile beagleBoneBlack() {
        BoardProfile profile;
        profile.name = "am335x_evm";
        profile.displayName = "BeagleBone Black";
        profile.bootloader = "barebox";
        profile.defconfig = "am335x_evm_defconfig";
        profile.volumeLabel = "boot";
        profile.defaultSize = "+64M";
        profile.images = {
            {"first-stage loader", "barebox-am33xx-beaglebone-mlo.mmc.img", "MLO"},
            {"main bootloader", "barebox-am33xx-beaglebone.img", "barebox.bin"},
        };
        return profile;
    }

    std::vector<PayloadArtifact> resolveArtifacts(const BoardProfile& profile,
                                                  const std::string& imagesDir) {
        std::vector<PayloadArtifact> artifacts;
        artifacts.reserve(profile.images.size());

        for (const auto& image : profile.images) {
            std::filesystem::path source = std::filesystem::path(imagesDir) / image.imageName;
            artifacts.push_back({image.description, source.string(), image.destinationName});
        }

        return artifacts;
    }
}
