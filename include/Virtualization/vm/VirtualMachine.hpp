#pragma once
#include "Core/interfaces/IHypervisorDomain.hpp"
#include <libvirt/libvirt.h>
#include <optional>
#include <string>

/**
 * @brief libvirt-backed IHypervisorDomain
 *
 * Owns the virDomainPtr; the connection it belongs to must outlive it.
 */
class VirtualMachine : public IHypervisorDomain {
public:
    // Takes ownership of @p domain.
    explicit VirtualMachine(virDomainPtr domain);
    ~VirtualMachine() override;

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::string xmlDescription() override;
    [[nodiscard]] bool isPersistent() override;
    [[nodiscard]] std::optional<BlockJobStatus> blockJobInfo(const std::string& targetDevice) override;
    void blockCopy(const std::string& targetDevice, const std::string& destinationXml) override;
    void blockJobPivot(const std::string& targetDevice) override;
    void undefineKeepNvram() override;
    void define(const std::string& xml) override;

private:
    virDomainPtr domain{nullptr};
    std::string domainName;

    void checkLibvirtError(int result, const std::string& action) const;
};
