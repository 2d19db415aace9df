#ifndef FS_PROVISIONER_HPP
#define FS_PROVISIONER_HPP

#include "lib/platform.hpp"
#include <memory>
#include <string>

namespace FilesystemProvisioner {

    extern const std::string MOUNT_PREFIX;

    // mkfs.vfat -F 32; throws FilesystemError (FormatFailed).
    void formatPartition(Platform::System& system, const std::string& partition);

    // fatlabel; throws FilesystemError (LabelFailed).
    void labelPartition(Platform::System& system, const std::string& partition,
                        const std::string& label);

    // A partition mounted on a private temporary directory. Destruction
    // syncs, unmounts and removes the directory, whatever happened since.
    class MountSession {
    private:
        Platform::System& system;
        std::string partition;
        std::string mountPoint;

    public:
        MountSession(Platform::System& sys, const std::string& part, const std::string& dir);
        ~MountSession();

        MountSession(const MountSession&) = delete;
        MountSession& operator=(const MountSession&) = delete;

        const std::string& path() const { return mountPoint; }
        const std::string& device() const { return partition; }
    };

    // Throws FilesystemError (MountFailed); nothing is left behind on failure.
    std::unique_ptr<MountSession> mountPartition(Platform::System& system,
                                                 const std::string& partition,
                                                 const std::string& prefix = MOUNT_PREFIX);
}

#endif // FS_PROVISIONER_HPP
