#ifndef DEV_HANDLER_HPP
#define DEV_HANDLER_HPP

#include "lib/platform.hpp"
#include <string>
#include <vector>

namespace DeviceHandler {

    struct TargetDevice {
        // Resolved node, e.g. /dev/sdb for /dev/disk/by-id/usb-...
        std::string path;
        std::vector<Platform::MountEntry> mountedPartitions;
        bool sensitive = false;
    };

    // Throws DeviceError (NotABlockDevice) unless `device` is a block special file.
    TargetDevice inspectDevice(Platform::System& system, const std::string& device);

    bool isSensitiveDevice(const std::string& device);
    bool belongsToDevice(const std::string& source, const std::string& device);
    std::vector<Platform::MountEntry> mountedPartitions(Platform::System& system,
                                                        const std::string& device);

    // sdb -> sdb1, mmcblk0 -> mmcblk0p1, nvme0n1 -> nvme0n1p1
    std::string partitionPath(const std::string& device, int number);

    // Best effort: failures are logged and ignored.
    void unmountDevice(Platform::System& system, const std::string& device);
    void wipeDevice(Platform::System& system, const std::string& device);
}

#endif // DEV_HANDLER_HPP
