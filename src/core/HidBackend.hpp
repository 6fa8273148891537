#pragma once
#include <pollswitch/Types.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pollswitch {

// An open handle to one HID interface. Implementations close the OS handle
// in close() and in their destructor; close() may be called repeatedly.
class HidConnection {
public:
    virtual ~HidConnection() = default;

    virtual IoResult sendFeatureReport(const Report& report) = 0;
    virtual IoResult writeOutputReport(const Report& report) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

// Access to the operating system's HID interface class.
class HidBackend {
public:
    // Return false to stop the walk.
    using InterfaceVisitor = std::function<bool(const std::string& devicePath)>;

    virtual ~HidBackend() = default;

    // Visits the path of every present HID interface. Interfaces whose path
    // cannot be resolved are skipped. Throws EnumerationError when the
    // interface class itself cannot be enumerated.
    virtual void enumerateInterfaces(const InterfaceVisitor& visitor) = 0;

    // Opens a short-lived handle, reads the attributes and releases it.
    virtual std::optional<DeviceAttributes> queryAttributes(const std::string& devicePath) = 0;

    // Opens a shared read/write handle. Throws DeviceOpenError.
    virtual std::unique_ptr<HidConnection> openHandle(const std::string& devicePath) = 0;
};

}
