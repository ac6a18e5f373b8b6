#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <libvirt/libvirt.h>
#include <libvirt/virterror.h>
#include <cstdlib>

VirtualMachine::VirtualMachine(virDomainPtr dom) : domain(dom) {
    if (!domain) throw HypervisorOperationException("lookup", "null domain handle");
    const char* n = virDomainGetName(domain);
    domainName = n ? n : "";
}

VirtualMachine::~VirtualMachine() {
    if (domain) virDomainFree(domain);
}

std::string VirtualMachine::name() const { return domainName; }

std::string VirtualMachine::xmlDescription() {
    char* xml = virDomainGetXMLDesc(domain, VIR_DOMAIN_XML_INACTIVE);
    if (!xml) {
        throw HypervisorOperationException("get XML description of " + domainName,
                                           HypervisorConnector::lastErrorMessage());
    }
    std::string description(xml);
    free(xml);
    return description;
}

bool VirtualMachine::isPersistent() {
    int rc = virDomainIsPersistent(domain);
    checkLibvirtError(rc, "query persistence");
    return rc == 1;
}

std::optional<BlockJobStatus> VirtualMachine::blockJobInfo(const std::string& targetDevice) {
    virDomainBlockJobInfo info{};
    int rc = virDomainGetBlockJobInfo(domain, targetDevice.c_str(), &info, 0);
    checkLibvirtError(rc, "query block job on " + targetDevice);
    if (rc == 0) return std::nullopt;
    return BlockJobStatus{info.cur, info.end};
}

void VirtualMachine::blockCopy(const std::string& targetDevice, const std::string& destinationXml) {
    BoostLogger::Debug("virDomainBlockCopy ", domainName, " ", targetDevice, " -> ", destinationXml);
    checkLibvirtError(virDomainBlockCopy(domain, targetDevice.c_str(), destinationXml.c_str(), nullptr, 0, 0),
                      "block copy " + targetDevice);
}

void VirtualMachine::blockJobPivot(const std::string& targetDevice) {
    checkLibvirtError(virDomainBlockJobAbort(domain, targetDevice.c_str(), VIR_DOMAIN_BLOCK_JOB_ABORT_PIVOT),
                      "pivot " + targetDevice);
}

void VirtualMachine::undefineKeepNvram() {
    checkLibvirtError(virDomainUndefineFlags(domain, VIR_DOMAIN_UNDEFINE_KEEP_NVRAM), "undefine " + domainName);
}

void VirtualMachine::define(const std::string& xml) {
    virConnectPtr conn = virDomainGetConnect(domain);
    if (!conn) {
        throw HypervisorOperationException("define " + domainName, HypervisorConnector::lastErrorMessage());
    }
    virDomainPtr defined = virDomainDefineXML(conn, xml.c_str());
    if (!defined) {
        throw HypervisorOperationException("define " + domainName, HypervisorConnector::lastErrorMessage());
    }
    virDomainFree(defined);
}

void VirtualMachine::checkLibvirtError(int result, const std::string& action) const {
    if (result < 0) {
        throw HypervisorOperationException(action, HypervisorConnector::lastErrorMessage());
    }
}
