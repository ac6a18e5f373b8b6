#pragma once
#include "Virtualization/vm/VolumeDescriptor.hpp"
#include <pugixml.hpp>
#include <string>

/**
 * @brief Reads the disks of a domain XML description into a VolumeMap
 *
 * Every <disk> under <domain><devices> must carry <target dev='...'/> and
 * either <source file='...'/> or <source pool='...' volume='...'/>.
 * Anything else throws MalformedDescriptorException.
 */
class VolumeInventory {
public:
    [[nodiscard]] static VolumeMap parse(const std::string& domainXml);

private:
    [[nodiscard]] static VolumeDescriptor parseDisk(const pugi::xml_node& disk, std::size_t index);
};
