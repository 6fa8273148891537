#include "DeviceChannel.hpp"
#include "HidBackend.hpp"
#include "Logger.hpp"
#include <pollswitch/Errors.hpp>

namespace pollswitch {

class DeviceChannel::Private {
public:
    HidBackend* backend{nullptr};
    std::unique_ptr<HidConnection> connection;
    std::string path;

    static IoResult notOpen() {
        IoResult result;
        result.error = "device handle is not open";
        return result;
    }
};

DeviceChannel::DeviceChannel(HidBackend& backend)
    : d(std::make_unique<Private>()) {
    d->backend = &backend;
}

DeviceChannel::~DeviceChannel() {
    close();
}

void DeviceChannel::open(const std::string& devicePath) {
    close();

    auto connection = d->backend->openHandle(devicePath);
    if (!connection || !connection->isOpen()) {
        throw DeviceOpenError("Failed to open device: " + devicePath);
    }

    d->connection = std::move(connection);
    d->path = devicePath;
}

void DeviceChannel::close() {
    if (d->connection) {
        d->connection->close();
        d->connection.reset();
        POLLSWITCH_LOG_DEBUG("Closed device handle: " + d->path);
    }
    d->path.clear();
}

bool DeviceChannel::isOpen() const {
    return d->connection && d->connection->isOpen();
}

std::string DeviceChannel::devicePath() const {
    return d->path;
}

IoResult DeviceChannel::sendFeatureReport(const Report& report) {
    if (!isOpen()) {
        return Private::notOpen();
    }
    return d->connection->sendFeatureReport(report);
}

IoResult DeviceChannel::writeOutputReport(const Report& report) {
    if (!isOpen()) {
        return Private::notOpen();
    }
    return d->connection->writeOutputReport(report);
}

}
