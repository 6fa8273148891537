#pragma once
#include "core/HidBackend.hpp"

namespace pollswitch {

// hid.dll / setupapi implementation of the HID capability interface.
class WindowsHidBackend : public HidBackend {
public:
    void enumerateInterfaces(const InterfaceVisitor& visitor) override;
    std::optional<DeviceAttributes> queryAttributes(const std::string& devicePath) override;
    std::unique_ptr<HidConnection> openHandle(const std::string& devicePath) override;
};

}
