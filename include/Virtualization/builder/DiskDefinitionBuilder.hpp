#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/vm/VolumeDescriptor.hpp"
#include "Virtualization/vmm/MigrationConfig.hpp"
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Builds the destination <disk> element handed to virDomainBlockCopy
 *
 * File destination:
 *   <disk type='file' device='disk'>
 *     <driver name='qemu' type='qcow2'/>
 *     <source file='/data/pool-b/web01.qcow2'/>
 *   </disk>
 *
 * Pool destination:
 *   <disk type='volume' device='disk'>
 *     <driver name='qemu' type='qcow2'/>
 *     <source pool='fast-ssd' volume='web01.qcow2'/>
 *   </disk>
 */
class DiskDefinitionBuilder : public IXmlBuilderBase {
private:
  std::optional<MigrationDestination> destination;
  std::string volumeName;
  std::string driverName{ "qemu" };
  std::string format{ "qcow2" };

  void buildDocument() override;

  void buildDriverSection(pugi::xml_node disk);
  void buildSourceSection(pugi::xml_node disk);

public:
  DiskDefinitionBuilder() = default;
  ~DiskDefinitionBuilder() override = default;

  DiskDefinitionBuilder& setDestination(const MigrationDestination& dest);

  // Leaf name the disk keeps at the destination (file name or volume name).
  DiskDefinitionBuilder& setVolumeName(std::string_view name);
  DiskDefinitionBuilder& setFormat(std::string_view fmt = "qcow2");

  // Shorthand for setVolumeName(volume.leafName()).
  DiskDefinitionBuilder& forVolume(const VolumeDescriptor& volume);

  // Full path of the destination file; empty for pool destinations.
  [[nodiscard]] std::string destinationFile() const;
};
