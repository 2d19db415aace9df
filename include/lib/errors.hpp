#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <exception>

enum class ErrorKind {
    PermissionDenied,
    InvalidArgument,
    MissingArtifact,
    MissingTool,
    NotABlockDevice,
    PartitioningFailed,
    PartitionNotReady,
    FormatFailed,
    LabelFailed,
    MountFailed,
    PayloadCopyFailed
};

class BootCardException : public std::exception {
private:
    ErrorKind errorKind;
    std::string message;

public:
    BootCardException(ErrorKind kind, const std::string& msg);
    const char* what() const noexcept override;
    ErrorKind kind() const noexcept;
};

class PermissionError : public BootCardException {
public:
    explicit PermissionError(const std::string& msg);
};

class FileError : public BootCardException {
public:
    FileError(const std::string& file, const std::string& cause);
};

class ToolError : public BootCardException {
public:
    ToolError(const std::string& tool, const std::string& cause);
};

class DeviceError : public BootCardException {
public:
    DeviceError(ErrorKind kind, const std::string& device, const std::string& cause);
};

class PartitionError : public BootCardException {
public:
    PartitionError(ErrorKind kind, const std::string& device, const std::string& cause);
};

class FilesystemError : public BootCardException {
public:
    FilesystemError(ErrorKind kind, const std::string& msg);
};

class PayloadError : public BootCardException {
public:
    PayloadError(const std::string& artifact, const std::string& cause);
};

namespace ErrorHandler {
    std::string kindName(ErrorKind kind);
    void checkPrivileges();
}

#endif // ERRORS_HPP
