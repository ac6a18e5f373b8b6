#include "Virtualization/builder/DiskDefinitionBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <filesystem>

void DiskDefinitionBuilder::buildDocument() {
  if (!destination) {
    throw InvalidDestinationException("No destination set for disk definition");
  }
  if (volumeName.empty()) {
    throw MalformedDescriptorException("Disk definition needs a volume name");
  }

  auto disk = doc.append_child("disk");
  disk.append_attribute("type") = destination->isFilePath() ? "file" : "volume";
  disk.append_attribute("device") = "disk";

  buildDriverSection(disk);
  buildSourceSection(disk);
}

void DiskDefinitionBuilder::buildDriverSection(pugi::xml_node disk) {
  auto driver = disk.append_child("driver");
  driver.append_attribute("name") = driverName.c_str();
  driver.append_attribute("type") = format.c_str();
}

void DiskDefinitionBuilder::buildSourceSection(pugi::xml_node disk) {
  auto source = disk.append_child("source");
  if (destination->isFilePath()) {
    source.append_attribute("file") = destinationFile().c_str();
  } else {
    source.append_attribute("pool") = destination->value().c_str();
    source.append_attribute("volume") = volumeName.c_str();
  }
}

DiskDefinitionBuilder& DiskDefinitionBuilder::setDestination(const MigrationDestination& dest) {
  destination = dest;
  return *this;
}

DiskDefinitionBuilder& DiskDefinitionBuilder::setVolumeName(std::string_view name) {
  volumeName = name;
  return *this;
}

DiskDefinitionBuilder& DiskDefinitionBuilder::setFormat(std::string_view fmt) {
  format = fmt;
  return *this;
}

DiskDefinitionBuilder& DiskDefinitionBuilder::forVolume(const VolumeDescriptor& volume) {
  return setVolumeName(volume.leafName());
}

std::string DiskDefinitionBuilder::destinationFile() const {
  if (!destination || !destination->isFilePath()) return {};
  return (std::filesystem::path(destination->value()) / volumeName).string();
}
