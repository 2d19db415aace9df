#ifndef PRECONDITIONS_HPP
#define PRECONDITIONS_HPP

#include "lib/board_profile.hpp"
#include "lib/platform.hpp"
#include <string>
#include <vector>

namespace Preconditions {

    extern const std::vector<std::string> REQUIRED_TOOLS;

    // Throws FileError (MissingArtifact) naming the first absent image.
    void checkArtifacts(Platform::System& system,
                        const std::vector<Board::PayloadArtifact>& artifacts);

    // Throws ToolError (MissingTool) naming the first utility not on PATH.
    void checkTools(Platform::System& system, const std::vector<std::string>& tools);
}

#endif // PRECONDITIONS_HPP
