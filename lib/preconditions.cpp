#include "lib/preconditions.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <filesystem>

namespace Preconditions {

    const std::vector<std::string> REQUIRED_TOOLS = {
        "wipefs", "sfdisk", "parted", "mkfs.vfat", "fatlabel"
    };

    void checkArtifacts(Platform::System& system,
                        const std::vector<Board::PayloadArtifact>& artifacts) {
        for (const auto& artifact : artifacts) {
            if (!system.isReadableFile(artifact.sourcePath)) {
                std::filesystem::path source(artifact.sourcePath);
                throw FileError(source.filename().string(),
                                artifact.description + " not found in " +
                                source.parent_path().string() + ", build the bootloader first");
            }

            Logs::debug("Found " + artifact.description + ": " + artifact.sourcePath);
        }
    }

    void checkTools(Platform::System& system, const std::vector<std::string>& tools) {
        for (const auto& tool : tools) {
            if (!system.findExecutable(tool)) {
                throw ToolError(tool, "required tool not found in PATH");
            }
        }
    }
}
