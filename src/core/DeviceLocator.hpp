#pragma once
#include <pollswitch/Types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pollswitch {

class HidBackend;

struct LocatedInterface {
    std::string devicePath;
    DeviceAttributes attributes;
    std::optional<int> interfaceNumber;
};

// Extracts the two hex digits following "&mi_" (case-insensitive), e.g.
// "\\?\hid#vid_373e&pid_001e&mi_02&col01#..." yields 2.
std::optional<int> parseInterfaceNumber(const std::string& devicePath);

class DeviceLocator {
public:
    explicit DeviceLocator(HidBackend& backend);

    // Returns the first interface matching vendor, product and interface
    // number. Throws DeviceNotFoundError or EnumerationError.
    LocatedInterface locate(const DeviceIdentity& identity) const;

    // Every interface with matching vendor/product, whatever its number.
    std::vector<LocatedInterface> listInterfaces(const DeviceIdentity& identity) const;

private:
    HidBackend& backend_;
};

}
