#pragma once
#include <pollswitch/Types.hpp>
#include <memory>
#include <string>

namespace pollswitch {

class HidBackend;

// Owns at most one open HID handle.
class DeviceChannel {
public:
    explicit DeviceChannel(HidBackend& backend);
    ~DeviceChannel();

    DeviceChannel(const DeviceChannel&) = delete;
    DeviceChannel& operator=(const DeviceChannel&) = delete;

    // Releases any previous handle first. Throws DeviceOpenError.
    void open(const std::string& devicePath);
    void close();
    bool isOpen() const;
    std::string devicePath() const;

    // Both return a failed IoResult when the channel is closed.
    IoResult sendFeatureReport(const Report& report);
    IoResult writeOutputReport(const Report& report);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
