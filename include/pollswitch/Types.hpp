#pragma once
#include "Constants.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace pollswitch {

// Identifies one logical interface of a composite HID device.
struct DeviceIdentity {
    uint16_t vendorId;
    uint16_t productId;
    int interfaceNumber;

    bool operator==(const DeviceIdentity& other) const {
        return vendorId == other.vendorId &&
               productId == other.productId &&
               interfaceNumber == other.interfaceNumber;
    }
};

constexpr DeviceIdentity TARGET_DEVICE{
    TARGET_VENDOR_ID, TARGET_PRODUCT_ID, TARGET_INTERFACE_NUMBER};

struct DeviceAttributes {
    uint16_t vendorId{0};
    uint16_t productId{0};
    uint16_t versionNumber{0};
};

// Fixed-size command buffer, byte 0 is the report id.
using Report = std::array<uint8_t, REPORT_SIZE>;

enum class TransmissionPath {
    FeatureReport,
    OutputReport
};

enum class WatcherState {
    Idle,
    GameActive
};

struct IoResult {
    bool ok{false};
    std::size_t bytesTransferred{0};
    std::string error;
};

// A game added by hand; only the executable name is watched.
struct CustomGame {
    std::string name;
    std::string executable;
    std::string path;
};

struct SteamLibrary {
    std::string path;
    std::string label;
};

// A game found by scanning the Steam libraries.
struct DetectedGame {
    std::string name;
    std::string appId;
    std::string executable;
    std::string installPath;
    std::string library;
    int64_t sizeMb{0};
};

}
