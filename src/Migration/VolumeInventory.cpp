#include "Migration/VolumeInventory.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <filesystem>

VolumeMap VolumeInventory::parse(const std::string& domainXml) {
    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_string(domainXml.c_str());
    if (!parsed) {
        throw MalformedDescriptorException(std::string("Domain XML does not parse: ") + parsed.description());
    }

    pugi::xml_node devices = doc.child("domain").child("devices");
    if (!devices) {
        throw MalformedDescriptorException("Domain XML has no <domain><devices> element");
    }

    VolumeMap volumes;
    std::size_t index = 0;
    for (pugi::xml_node disk : devices.children("disk")) {
        VolumeDescriptor volume = parseDisk(disk, index++);
        std::string target = volume.targetDevice;
        if (!volumes.emplace(target, std::move(volume)).second) {
            throw MalformedDescriptorException("Target device '" + target + "' is used by more than one disk");
        }
    }

    BoostLogger::Debug("Inventory found ", volumes.size(), " disk(s)");
    return volumes;
}

VolumeDescriptor VolumeInventory::parseDisk(const pugi::xml_node& disk, std::size_t index) {
    std::string target = disk.child("target").attribute("dev").as_string();
    if (target.empty()) {
        throw MalformedDescriptorException("Disk #" + std::to_string(index) + " has no target device");
    }

    pugi::xml_node source = disk.child("source");
    std::string file = source.attribute("file").as_string();
    std::string pool = source.attribute("pool").as_string();

    if (!file.empty()) {
        std::filesystem::path path(file);
        if (!path.has_filename()) {
            throw MalformedDescriptorException("Disk " + target + " source file has no file name: " + file);
        }
        return VolumeDescriptor{target, FileBacked{path.parent_path().string(), path.filename().string()}};
    }

    if (!pool.empty()) {
        std::string volume = source.attribute("volume").as_string();
        if (volume.empty()) {
            throw MalformedDescriptorException("Disk " + target + " names pool '" + pool + "' but no volume");
        }
        return VolumeDescriptor{target, PoolBacked{pool, volume}};
    }

    throw MalformedDescriptorException("Disk " + target + " has neither a file nor a pool source");
}
