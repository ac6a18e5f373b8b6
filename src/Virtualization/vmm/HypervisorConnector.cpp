#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>

namespace {

// libvirt prints every error to stderr by default; errors surface through
// exceptions here, so keep the raw text in the debug log only.
void forwardLibvirtError(void* /*userData*/, virErrorPtr error) {
    if (error && error->message) {
        BoostLogger::Debug("libvirt: ", error->message);
    }
}

} // namespace

HypervisorConnector::HypervisorConnector(ConnectionConfig config)
    : config(std::move(config)) {
    connectionUri = this->config.toUri();
    virSetErrorFunc(nullptr, forwardLibvirtError);
}

HypervisorConnector::~HypervisorConnector() {
    close();
}

bool HypervisorConnector::connect() noexcept {
    if (conn) return true;
    conn = virConnectOpen(connectionUri.c_str());
    return conn != nullptr;
}

void HypervisorConnector::connectOrThrow() {
    if (!connect()) {
        throw ConnectionException("Failed to open connection to hypervisor for URI \"" + connectionUri +
                                  "\": " + lastErrorMessage());
    }
    BoostLogger::Info("Connected to ", connectionUri);
}

void HypervisorConnector::close() noexcept {
    if (conn) {
        virConnectClose(conn);
        conn = nullptr;
    }
}

virConnectPtr HypervisorConnector::getRawHandle() const noexcept {
    return conn;
}

virConnectPtr HypervisorConnector::ensureConnected() {
    if (!conn) {
        connectOrThrow();
    }
    return conn;
}

bool HypervisorConnector::isConnected() const noexcept {
    return conn != nullptr;
}

const std::string& HypervisorConnector::uri() const noexcept {
    return connectionUri;
}

std::unique_ptr<VirtualMachine> HypervisorConnector::lookupDomain(std::string_view name) {
    std::string domainName(name);
    virDomainPtr domain = virDomainLookupByName(ensureConnected(), domainName.c_str());
    if (!domain) {
        throw HypervisorOperationException("lookup " + domainName, lastErrorMessage());
    }
    return std::make_unique<VirtualMachine>(domain);
}

std::string HypervisorConnector::lastErrorMessage() {
    virErrorPtr e = virGetLastError();
    return (e && e->message) ? e->message : "unknown";
}
