#pragma once
#include <cstddef>
#include <cstdint>

namespace pollswitch {

constexpr uint16_t TARGET_VENDOR_ID = 0x373E;
constexpr uint16_t TARGET_PRODUCT_ID = 0x001E;
constexpr int TARGET_INTERFACE_NUMBER = 2;

constexpr std::size_t REPORT_SIZE = 65;

constexpr int DEFAULT_POLLING_RATE = 1000;  // Hz
constexpr int GAME_POLLING_RATE = 2000;     // Hz
constexpr int CHECK_INTERVAL = 2000;        // ms
constexpr int RESCAN_MIN_AGE = 24;          // hours

namespace ErrorCodes {
    constexpr int SUCCESS = 0;
    constexpr int DEVICE_NOT_FOUND = -1;
    constexpr int DEVICE_OPEN_FAILED = -2;
    constexpr int UNSUPPORTED_RATE = -3;
    constexpr int TRANSMISSION_FAILED = -4;
    constexpr int NOT_CONNECTED = -5;
    constexpr int ENUMERATION_FAILED = -6;
    constexpr int PROCESS_LIST_UNAVAILABLE = -7;
    constexpr int CONFIG_ERROR = -8;
}

}
