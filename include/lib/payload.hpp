#ifndef PAYLOAD_HPP
#define PAYLOAD_HPP

#include "lib/board_profile.hpp"
#include "lib/platform.hpp"
#include <string>
#include <vector>

namespace Payload {
    // Copies every artifact into mountPoint under its destination name.
    // Throws PayloadError (PayloadCopyFailed) naming the failing artifact.
    void installPayload(Platform::System& system, const std::string& mountPoint,
                        const std::vector<Board::PayloadArtifact>& artifacts);
}

#endif // PAYLOAD_HPP
