#ifndef PLATFORM_HPP
#define PLATFORM_HPP

#include <chrono>
#include <string>
#include <vector>

namespace Platform {

    struct MountEntry {
        std::string source;
        std::string target;
        std::string fsType;
    };

    struct CommandResult {
        int exitStatus;
        std::string output;

        bool succeeded() const { return exitStatus == 0; }
    };

    // Everything the provisioning workflow needs from the host system.
    // LinuxSystem talks to the kernel; tests substitute a recording fake.
    class System {
    public:
        virtual ~System() = default;

        virtual bool isBlockDevice(const std::string& path) = 0;
        virtual bool isReadableFile(const std::string& path) = 0;

        // Follows symlinks (/dev/disk/by-id/...) to the real node.
        // Returns `path` unchanged when it cannot be resolved.
        virtual std::string resolvePath(const std::string& path) = 0;

        virtual bool findExecutable(const std::string& name) = 0;
        virtual std::vector<MountEntry> mountTable() = 0;

        // Runs argv synchronously, feeding `input` on stdin.
        // stdout and stderr are merged into the result output. The process
        // should ignore SIGPIPE; the child runs with the default action.
        virtual CommandResult run(const std::vector<std::string>& argv,
                                  const std::string& input = "") = 0;

        virtual bool rereadPartitionTable(const std::string& device) = 0;

        // Returns the created directory, or an empty string on failure.
        virtual std::string makeTempDir(const std::string& prefix) = 0;
        virtual bool removeDir(const std::string& path) = 0;

        virtual bool mount(const std::string& source, const std::string& target,
                           const std::string& fsType) = 0;
        virtual bool unmount(const std::string& target, bool lazy) = 0;

        virtual bool copyFile(const std::string& from, const std::string& to) = 0;
        virtual void sync() = 0;
        virtual void sleepFor(std::chrono::milliseconds duration) = 0;
    };

    class LinuxSystem : public System {
    public:
        bool isBlockDevice(const std::string& path) override;
        bool isReadableFile(const std::string& path) override;
        std::string resolvePath(const std::string& path) override;
        bool findExecutable(const std::string& name) override;
        std::vector<MountEntry> mountTable() override;

        CommandResult run(const std::vector<std::string>& argv,
                          const std::string& input = "") override;

        bool rereadPartitionTable(const std::string& device) override;

        std::string makeTempDir(const std::string& prefix) override;
        bool removeDir(const std::string& path) override;

        bool mount(const std::string& source, const std::string& target,
                   const std::string& fsType) override;
        bool unmount(const std::string& target, bool lazy) override;

        bool copyFile(const std::string& from, const std::string& to) override;
        void sync() override;
        void sleepFor(std::chrono::milliseconds duration) override;
    };
}

#endif // PLATFORM_HPP
