#include "DeviceLocator.hpp"
#include "HidBackend.hpp"
#include "Logger.hpp"
#include <pollswitch/Errors.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace pollswitch {

namespace {

const std::string INTERFACE_MARKER = "&mi_";

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string describe(const DeviceAttributes& attributes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "VID=0x%04X PID=0x%04X",
                  attributes.vendorId, attributes.productId);
    return buffer;
}

} // namespace

std::optional<int> parseInterfaceNumber(const std::string& devicePath) {
    std::string lower(devicePath);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto pos = lower.find(INTERFACE_MARKER);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    auto start = pos + INTERFACE_MARKER.size();
    if (start + 2 > lower.size()) {
        return std::nullopt;
    }

    int high = hexDigit(lower[start]);
    int low = hexDigit(lower[start + 1]);
    if (high < 0 || low < 0) {
        return std::nullopt;
    }
    return high * 16 + low;
}

DeviceLocator::DeviceLocator(HidBackend& backend)
    : backend_(backend) {
}

LocatedInterface DeviceLocator::locate(const DeviceIdentity& identity) const {
    std::optional<LocatedInterface> found;

    backend_.enumerateInterfaces([&](const std::string& path) {
        POLLSWITCH_LOG_DEBUG("Checking device: " + path);

        auto attributes = backend_.queryAttributes(path);
        if (!attributes) {
            return true;
        }

        if (attributes->vendorId != identity.vendorId ||
            attributes->productId != identity.productId) {
            return true;
        }

        auto number = parseInterfaceNumber(path);
        if (!number || *number != identity.interfaceNumber) {
            POLLSWITCH_LOG_DEBUG("Skipping interface " +
                                 (number ? std::to_string(*number) : std::string("?")) +
                                 " (need " + std::to_string(identity.interfaceNumber) +
                                 "): " + path);
            return true;
        }

        POLLSWITCH_LOG_DEBUG("Found " + describe(*attributes) + " on interface " +
                             std::to_string(*number) + ": " + path);
        found = LocatedInterface{path, *attributes, number};
        return false;
    });

    if (!found) {
        throw DeviceNotFoundError(
            "Device not found - make sure it is connected and you have access to it");
    }
    return *found;
}

std::vector<LocatedInterface> DeviceLocator::listInterfaces(const DeviceIdentity& identity) const {
    std::vector<LocatedInterface> result;

    backend_.enumerateInterfaces([&](const std::string& path) {
        auto attributes = backend_.queryAttributes(path);
        if (attributes &&
            attributes->vendorId == identity.vendorId &&
            attributes->productId == identity.productId) {
            result.push_back({path, *attributes, parseInterfaceNumber(path)});
        }
        return true;
    });

    return result;
}

}
