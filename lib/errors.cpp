#include "lib/errors.hpp"
#include <unistd.h>

BootCardException::BootCardException(ErrorKind kind, const std::string& msg)
    : errorKind(kind), message(msg) {}

const char* BootCardException::what() const noexcept {
    return message.c_str();
}

ErrorKind BootCardException::kind() const noexcept {
    return errorKind;
}

PermissionError::PermissionError(const std::string& msg)
    : BootCardException(ErrorKind::PermissionDenied, msg) {}

FileError::FileError(const std::string& file, const std::string& cause)
    : BootCardException(ErrorKind::MissingArtifact, "File error with " + file + ": " + cause) {}

ToolError::ToolError(const std::string& tool, const std::string& cause)
    : BootCardException(ErrorKind::MissingTool, "Tool error with '" + tool + "': " + cause) {}

DeviceError::DeviceError(ErrorKind kind, const std::string& device, const std::string& cause)
    : BootCardException(kind, "Device error on " + device + ": " + cause) {}

PartitionError::PartitionError(ErrorKind kind, const std::string& device, const std::string& cause)
    : BootCardException(kind, "Partitioning error on " + device + ": " + cause) {}

FilesystemError::FilesystemError(ErrorKind kind, const std::string& msg)
    : BootCardException(kind, "Filesystem error: " + msg) {}

PayloadError::PayloadError(const std::string& artifact, const std::string& cause)
    : BootCardException(ErrorKind::PayloadCopyFailed, "Payload error with " + artifact + ": " + cause) {}

namespace ErrorHandler {
    std::string kindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::PermissionDenied: return "PermissionDenied";
            case ErrorKind::InvalidArgument: return "InvalidArgument";
            case ErrorKind::MissingArtifact: return "MissingArtifact";
            case ErrorKind::MissingTool: return "MissingTool";
            case ErrorKind::NotABlockDevice: return "NotABlockDevice";
            case ErrorKind::PartitioningFailed: return "PartitioningFailed";
            case ErrorKind::PartitionNotReady: return "PartitionNotReady";
            case ErrorKind::FormatFailed: return "FormatFailed";
            case ErrorKind::LabelFailed: return "LabelFailed";
            case ErrorKind::MountFailed: return "MountFailed";
            case ErrorKind::PayloadCopyFailed: return "PayloadCopyFailed";
        }
        return "Unknown";
    }

    void checkPrivileges() {
        if (geteuid() != 0) {
            throw PermissionError("This is a privileged tool, run it as root (e.g. with sudo)");
        }
    }
}
