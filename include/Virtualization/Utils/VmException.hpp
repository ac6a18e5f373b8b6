#pragma once
#include <stdexcept>
#include <string>

class VmException : public std::runtime_error {
public:
    explicit VmException(const std::string& msg) : std::runtime_error(msg) {}

    // Process exit status reported by the command-line front end.
    [[nodiscard]] virtual int exitCode() const noexcept { return 1; }
};

class InvalidDestinationException : public VmException {
public:
    explicit InvalidDestinationException(const std::string& msg) : VmException("[Destination] " + msg) {}
    [[nodiscard]] int exitCode() const noexcept override { return 2; }
};

class MalformedDescriptorException : public VmException {
public:
    explicit MalformedDescriptorException(const std::string& msg) : VmException("[Descriptor] " + msg) {}
    [[nodiscard]] int exitCode() const noexcept override { return 3; }
};

class ConnectionException : public VmException {
public:
    explicit ConnectionException(const std::string& msg) : VmException("[Connection] " + msg) {}
    [[nodiscard]] int exitCode() const noexcept override { return 4; }
};

class HypervisorOperationException : public VmException {
public:
    HypervisorOperationException(const std::string& operation, const std::string& msg)
        : VmException("[Libvirt] " + operation + ": " + msg), operation_(operation) {}

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] int exitCode() const noexcept override { return 5; }

private:
    std::string operation_;
};

class BackupException : public VmException {
public:
    explicit BackupException(const std::string& msg) : VmException("[Backup] " + msg) {}
    [[nodiscard]] int exitCode() const noexcept override { return 6; }
};

class OperatorDeclinedException : public VmException {
public:
    OperatorDeclinedException() : VmException("[Operator] migration declined, nothing was changed") {}
};
