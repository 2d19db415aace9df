#include "lib/payload.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <filesystem>

namespace Payload {

    void installPayload(Platform::System& system, const std::string& mountPoint,
                        const std::vector<Board::PayloadArtifact>& artifacts) {
        Logs::info("Copying bootloader images to SD card...");

        for (const auto& artifact : artifacts) {
            std::string destination = (std::filesystem::path(mountPoint) / artifact.destinationName).string();

            if (!system.copyFile(artifact.sourcePath, destination)) {
                throw PayloadError(artifact.sourcePath,
                                   "cannot copy " + artifact.description + " to " + destination);
            }

            Logs::info("  " + artifact.sourcePath + " -> " + artifact.destinationName);
        }
    }
}
