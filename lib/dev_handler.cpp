#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <cctype>
#include <regex>

namespace DeviceHandler {

    namespace {
        // First SATA/SCSI, IDE and NVMe disks, and their partitions.
        const std::regex SENSITIVE_DEVICES(R"(^/dev/((sd|hd)a[0-9]*|nvme0n1(p[0-9]+)?)$)");
    }

    TargetDevice inspectDevice(Platform::System& system, const std::string& device) {
        Logs::info("Validating SD card device: " + device);

        if (!system.isBlockDevice(device)) {
            throw DeviceError(ErrorKind::NotABlockDevice, device,
                              "does not exist or is not a block device");
        }

        TargetDevice target;
        target.path = system.resolvePath(device);
        target.mountedPartitions = mountedPartitions(system, target.path);
        target.sensitive = isSensitiveDevice(target.path);

        if (target.path != device) {
            Logs::info(device + " resolves to " + target.path);

            for (const auto& entry : mountedPartitions(system, device)) {
                target.mountedPartitions.push_back(entry);
            }
            target.sensitive = target.sensitive || isSensitiveDevice(device);
        }

        if (!target.mountedPartitions.empty()) {
            Logs::warning("Device " + device + " has mounted partitions");
            for (const auto& entry : target.mountedPartitions) {
                Logs::info("  " + entry.source + " on " + entry.target);
            }
            Logs::info("Will attempt to unmount them");
        }

        return target;
    }

    bool isSensitiveDevice(const std::string& device) {
        return std::regex_match(device, SENSITIVE_DEVICES);
    }

    bool belongsToDevice(const std::string& source, const std::string& device) {
        if (device.empty() || source.compare(0, device.size(), device) != 0) {
            return false;
        }

        std::string suffix = source.substr(device.size());
        if (suffix.empty()) {
            return true;
        }

        if (suffix[0] == 'p' && suffix.size() > 1) {
            suffix = suffix.substr(1);
        }

        for (char c : suffix) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }

    std::vector<Platform::MountEntry> mountedPartitions(Platform::System& system,
                                                        const std::string& device) {
        std::vector<Platform::MountEntry> mounted;

        for (const auto& entry : system.mountTable()) {
            if (belongsToDevice(entry.source, device)) {
                mounted.push_back(entry);
            }
        }

        return mounted;
    }

    std::string partitionPath(const std::string& device, int number) {
        if (!device.empty() && std::isdigit(static_cast<unsigned char>(device.back()))) {
            return device + "p" + std::to_string(number);
        }

        return device + std::to_string(number);
    }

    void unmountDevice(Platform::System& system, const std::string& device) {
        auto mounted = mountedPartitions(system, device);
        if (mounted.empty()) {
            Logs::debug("No mounted partitions on " + device);
            return;
        }

        Logs::info("Unmounting existing partitions on " + device + "...");

        // Innermost mounts come last in the table.
        for (auto it = mounted.rbegin(); it != mounted.rend(); ++it) {
            if (system.unmount(it->target, false)) {
                continue;
            }

            Logs::warning("Failed to unmount " + it->target + " cleanly, detaching...");
            if (!system.unmount(it->target, true)) {
                Logs::warning("Could not unmount " + it->target + ", continuing");
            }
        }
    }

    void wipeDevice(Platform::System& system, const std::string& device) {
        Logs::info("Wiping existing filesystem signatures...");

        auto result = system.run({"wipefs", "-a", device});
        if (!result.succeeded()) {
            Logs::debug("wipefs exited with " + std::to_string(result.exitStatus) +
                        ", nothing to wipe: " + result.output);
        }
    }
}
