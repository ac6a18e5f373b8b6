#pragma once

#include "Virtualization/vmm/MigrationConfig.hpp"
#include <libvirt/libvirt.h>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

class VirtualMachine;

class HypervisorConnector {
public:
    explicit HypervisorConnector(ConnectionConfig config);
    ~HypervisorConnector();

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    bool connect() noexcept;
    // Throws ConnectionException carrying the libvirt error message.
    void connectOrThrow();
    void close() noexcept;

    [[nodiscard]] virConnectPtr getRawHandle() const noexcept;
    [[nodiscard]] virConnectPtr ensureConnected();
    [[nodiscard]] bool isConnected() const noexcept;
    [[nodiscard]] const std::string& uri() const noexcept;

    // Throws HypervisorOperationException when the domain does not exist.
    [[nodiscard]] std::unique_ptr<VirtualMachine> lookupDomain(std::string_view name);

    // Message of the last libvirt error on this thread, "unknown" if none.
    [[nodiscard]] static std::string lastErrorMessage();

private:
    ConnectionConfig config;
    std::string connectionUri;
    virConnectPtr conn{nullptr};
};
