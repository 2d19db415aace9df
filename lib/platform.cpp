#include "lib/platform.hpp"
#include "utils/logs.hpp"
#include <sys/stat.h>
#include <sys/mount.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <poll.h>
#include <linux/fs.h>
#include <mntent.h>
#include <unistd.h>
#include <fcntl.h>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

namespace Platform {

    namespace {
        const char* MOUNT_TABLE = "/proc/self/mounts";

        std::string errnoText() {
            return std::strerror(errno);
        }

        bool isExecutableFile(const std::string& path) {
            struct stat st;
            if (stat(path.c_str(), &st) != 0) {
                return false;
            }

            return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
        }

        // Feeds `input` to inFd while draining outFd into `output`, so a
        // child that writes before reading all of its stdin cannot block
        // on a full pipe. Takes ownership of both descriptors. Returns
        // false when the child stopped reading before the input ended.
        bool exchange(int inFd, int outFd, const std::string& input, std::string& output) {
            bool delivered = true;
            size_t written = 0;
            char buffer[4096];

            if (input.empty()) {
                close(inFd);
                inFd = -1;
            } else {
                fcntl(inFd, F_SETFL, fcntl(inFd, F_GETFL) | O_NONBLOCK);
            }

            while (inFd >= 0 || outFd >= 0) {
                struct pollfd fds[2];
                nfds_t count = 0;
                int inIndex = -1;
                int outIndex = -1;

                if (outFd >= 0) {
                    outIndex = static_cast<int>(count);
                    fds[count++] = {outFd, POLLIN, 0};
                }
                if (inFd >= 0) {
                    inIndex = static_cast<int>(count);
                    fds[count++] = {inFd, POLLOUT, 0};
                }

                if (poll(fds, count, -1) < 0) {
                    if (errno == EINTR) continue;
                    break;
                }

                if (inIndex >= 0 && fds[inIndex].revents != 0) {
                    ssize_t n = write(inFd, input.data() + written, input.size() - written);
                    if (n > 0) {
                        written += static_cast<size_t>(n);
                    } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                        delivered = false;
                        written = input.size();
                    }

                    if (written >= input.size()) {
                        close(inFd);
                        inFd = -1;
                    }
                }

                if (outIndex >= 0 && fds[outIndex].revents != 0) {
                    ssize_t n = read(outFd, buffer, sizeof(buffer));
                    if (n > 0) {
                        output.append(buffer, static_cast<size_t>(n));
                    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                        close(outFd);
                        outFd = -1;
                    }
                }
            }

            if (inFd >= 0) close(inFd);
            if (outFd >= 0) close(outFd);

            return delivered;
        }

        void closePipe(int fds[2]) {
            if (fds[0] >= 0) close(fds[0]);
            if (fds[1] >= 0) close(fds[1]);
        }
    }

    bool LinuxSystem::isBlockDevice(const std::string& path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            return false;
        }

        return S_ISBLK(st.st_mode);
    }

    bool LinuxSystem::isReadableFile(const std::string& path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            return false;
        }

        return S_ISREG(st.st_mode) && access(path.c_str(), R_OK) == 0;
    }

    std::string LinuxSystem::resolvePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            Logs::debug("Cannot resolve " + path + ": " + errnoText());
            return path;
        }

        std::string result(resolved);
        free(resolved);
        return result;
    }

    bool LinuxSystem::findExecutable(const std::string& name) {
        if (name.empty()) return false;

        if (name.find('/') != std::string::npos) {
            return isExecutableFile(name);
        }

        const char* pathEnv = std::getenv("PATH");
        std::string searchPath = pathEnv ? pathEnv : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

        std::istringstream dirs(searchPath);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) dir = ".";
            if (isExecutableFile(dir + "/" + name)) {
                return true;
            }
        }

        return false;
    }

    std::vector<MountEntry> LinuxSystem::mountTable() {
        std::vector<MountEntry> entries;

        FILE* table = setmntent(MOUNT_TABLE, "r");
        if (!table) {
            Logs::warning(std::string("Cannot read mount table: ") + errnoText());
            return entries;
        }

        struct mntent* entry;
        while ((entry = getmntent(table)) != nullptr) {
            entries.push_back({entry->mnt_fsname, entry->mnt_dir, entry->mnt_type});
        }

        endmntent(table);
        return entries;
    }

    CommandResult LinuxSystem::run(const std::vector<std::string>& argv, const std::string& input) {
        if (argv.empty()) {
            return {-1, "empty command line"};
        }

        Logs::command(argv);
        if (!input.empty()) {
            Logs::debug("stdin for " + argv[0] + ":\n" + input);
        }

        int inPipe[2] = {-1, -1};
        int outPipe[2] = {-1, -1};

        if (pipe2(inPipe, O_CLOEXEC) != 0) {
            return {-1, "pipe failed: " + errnoText()};
        }

        if (pipe2(outPipe, O_CLOEXEC) != 0) {
            std::string cause = errnoText();
            closePipe(inPipe);
            return {-1, "pipe failed: " + cause};
        }

        pid_t pid = fork();
        if (pid < 0) {
            std::string cause = errnoText();
            closePipe(inPipe);
            closePipe(outPipe);
            return {-1, "fork failed: " + cause};
        }

        if (pid == 0) {
            // Ignored signals survive exec; tools expect the default.
            std::signal(SIGPIPE, SIG_DFL);

            dup2(inPipe[0], STDIN_FILENO);
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(outPipe[1], STDERR_FILENO);

            std::vector<char*> args;
            for (const auto& arg : argv) {
                args.push_back(const_cast<char*>(arg.c_str()));
            }
            args.push_back(nullptr);

            execvp(args[0], args.data());
            _exit(127);
        }

        close(inPipe[0]);
        close(outPipe[1]);

        std::string output;
        bool inputDelivered = exchange(inPipe[1], outPipe[0], input, output);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return {-1, "waitpid failed: " + errnoText()};
            }
        }

        int exitStatus = -1;
        if (WIFEXITED(status)) {
            exitStatus = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitStatus = 128 + WTERMSIG(status);
        }

        if (!inputDelivered && exitStatus == 0) {
            Logs::debug(argv[0] + " exited before reading all of its input");
        }

        return {exitStatus, output};
    }

    bool LinuxSystem::rereadPartitionTable(const std::string& device) {
        Logs::debug("ioctl BLKRRPART " + device);

        int fd = open(device.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd >= 0) {
            int rc = ioctl(fd, BLKRRPART);
            std::string cause = errnoText();
            close(fd);

            if (rc == 0) {
                return true;
            }

            Logs::debug("BLKRRPART on " + device + " failed: " + cause);
        }

        if (!findExecutable("partprobe")) {
            return false;
        }

        return run({"partprobe", device}).succeeded();
    }

    std::string LinuxSystem::makeTempDir(const std::string& prefix) {
        std::string pattern = prefix + "XXXXXX";
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        Logs::command({"mktemp", "-d", pattern});

        if (mkdtemp(buffer.data()) == nullptr) {
            Logs::debug("mkdtemp " + pattern + " failed: " + errnoText());
            return "";
        }

        return std::string(buffer.data());
    }

    bool LinuxSystem::removeDir(const std::string& path) {
        Logs::command({"rmdir", path});

        if (rmdir(path.c_str()) != 0) {
            Logs::debug("rmdir " + path + " failed: " + errnoText());
            return false;
        }

        return true;
    }

    bool LinuxSystem::mount(const std::string& source, const std::string& target,
                            const std::string& fsType) {
        Logs::command({"mount", "-t", fsType, source, target});

        if (::mount(source.c_str(), target.c_str(), fsType.c_str(), 0, nullptr) != 0) {
            Logs::error("mount " + source + " on " + target + " failed: " + errnoText());
            return false;
        }

        return true;
    }

    bool LinuxSystem::unmount(const std::string& target, bool lazy) {
        if (lazy) {
            Logs::command({"umount", "-l", target});
        } else {
            Logs::command({"umount", target});
        }

        if (umount2(target.c_str(), lazy ? MNT_DETACH : 0) != 0) {
            Logs::debug("umount " + target + " failed: " + errnoText());
            return false;
        }

        return true;
    }

    bool LinuxSystem::copyFile(const std::string& from, const std::string& to) {
        Logs::command({"cp", from, to});

        std::error_code ec;
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logs::error("cp " + from + " " + to + " failed: " + ec.message());
            return false;
        }

        return true;
    }

    void LinuxSystem::sync() {
        Logs::command({"sync"});
        ::sync();
    }

    void LinuxSystem::sleepFor(std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    }
}
