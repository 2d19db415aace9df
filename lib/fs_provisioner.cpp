#include "lib/fs_provisioner.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"

namespace FilesystemProvisioner {

    const std::string MOUNT_PREFIX = "/tmp/sdcard.";

    void formatPartition(Platform::System& system, const std::string& partition) {
        Logs::info("Formatting partition as FAT32...");

        auto result = system.run({"mkfs.vfat", "-F", "32", partition});
        if (!result.succeeded()) {
            Logs::error("mkfs.vfat output: " + result.output);
            throw FilesystemError(ErrorKind::FormatFailed,
                                  "Failed to format " + partition + " as FAT32");
        }
    }

    void labelPartition(Platform::System& system, const std::string& partition,
                        const std::string& label) {
        Logs::info("Labeling partition as '" + label + "'...");

        auto result = system.run({"fatlabel", partition, label});
        if (!result.succeeded()) {
            Logs::error("fatlabel output: " + result.output);
            throw FilesystemError(ErrorKind::LabelFailed,
                                  "Failed to label " + partition + " as '" + label + "'");
        }
    }

    MountSession::MountSession(Platform::System& sys, const std::string& part, const std::string& dir)
        : system(sys), partition(part), mountPoint(dir) {
    }

    MountSession::~MountSession() {
        Logs::info("Syncing and unmounting...");

        system.sync();

        if (!system.unmount(mountPoint, false)) {
            Logs::warning("Failed to unmount " + mountPoint + " cleanly, detaching...");
            if (!system.unmount(mountPoint, true)) {
                Logs::warning("Could not unmount " + mountPoint + ", leaving it in place");
                return;
            }
        }

        if (!system.removeDir(mountPoint)) {
            Logs::warning("Could not remove mount point " + mountPoint);
        }
    }

    std::unique_ptr<MountSession> mountPartition(Platform::System& system,
                                                 const std::string& partition,
                                                 const std::string& prefix) {
        Logs::info("Mounting SD card partition...");

        std::string mountPoint = system.makeTempDir(prefix);
        if (mountPoint.empty()) {
            throw FilesystemError(ErrorKind::MountFailed,
                                  "Cannot create a mount point under " + prefix);
        }

        if (!system.mount(partition, mountPoint, "vfat")) {
            if (!system.removeDir(mountPoint)) {
                Logs::warning("Could not remove mount point " + mountPoint);
            }
            throw FilesystemError(ErrorKind::MountFailed,
                                  "Cannot mount " + partition + " on " + mountPoint);
        }

        Logs::debug(partition + " mounted on " + mountPoint);
        return std::make_unique<MountSession>(system, partition, mountPoint);
    }
}
