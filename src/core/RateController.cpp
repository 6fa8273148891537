#include "RateController.hpp"
#include "CommandEncoder.hpp"
#include "DeviceChannel.hpp"
#include "DeviceLocator.hpp"
#include "HidBackend.hpp"
#include "Logger.hpp"
#include <pollswitch/Errors.hpp>
#include <cstdio>
#include <mutex>

namespace pollswitch {

class RateController::Private {
public:
    Private(HidBackend& backend, const DeviceIdentity& identity)
        : locator(backend)
        , channel(backend)
        , identity(identity) {}

    DeviceLocator locator;
    DeviceChannel channel;
    DeviceIdentity identity;
    DeviceAttributes attributes{};
    mutable std::mutex ioMutex;
};

RateController::RateController(HidBackend& backend, const DeviceIdentity& identity)
    : d(std::make_unique<Private>(backend, identity)) {
}

RateController::~RateController() {
    close();
}

void RateController::connectDevice() {
    std::lock_guard<std::mutex> lock(d->ioMutex);

    d->channel.close();
    d->attributes = DeviceAttributes{};

    LocatedInterface located = d->locator.locate(d->identity);
    d->channel.open(located.devicePath);
    d->attributes = located.attributes;

    char ids[40];
    std::snprintf(ids, sizeof(ids), "VID=0x%04X, PID=0x%04X",
                  d->attributes.vendorId, d->attributes.productId);
    POLLSWITCH_LOG_INFO("Connected to device: " + std::string(ids));
}

TransmissionPath RateController::setRate(int rate) {
    const Report report = CommandEncoder::encode(rate);

    std::lock_guard<std::mutex> lock(d->ioMutex);

    if (!d->channel.isOpen()) {
        throw NotConnectedError();
    }

    POLLSWITCH_LOG_DEBUG("Sending command: [" + CommandEncoder::toHex(report) + "]");

    IoResult feature = d->channel.sendFeatureReport(report);
    if (feature.ok) {
        POLLSWITCH_LOG_INFO("Polling rate set to " + std::to_string(rate) +
                            "Hz via feature report");
        return TransmissionPath::FeatureReport;
    }

    POLLSWITCH_LOG_DEBUG("Feature report rejected (" + feature.error +
                         "), trying output report");

    IoResult output = d->channel.writeOutputReport(report);
    if (output.ok) {
        POLLSWITCH_LOG_INFO("Polling rate set to " + std::to_string(rate) +
                            "Hz via output report (" +
                            std::to_string(output.bytesTransferred) + " bytes written)");
        return TransmissionPath::OutputReport;
    }

    throw TransmissionError(feature.error, output.error);
}

void RateController::testConnection() const {
    std::lock_guard<std::mutex> lock(d->ioMutex);
    if (!d->channel.isOpen()) {
        throw NotConnectedError();
    }
}

void RateController::close() {
    std::lock_guard<std::mutex> lock(d->ioMutex);
    d->channel.close();
}

bool RateController::isConnected() const {
    std::lock_guard<std::mutex> lock(d->ioMutex);
    return d->channel.isOpen();
}

DeviceAttributes RateController::attributes() const {
    std::lock_guard<std::mutex> lock(d->ioMutex);
    return d->attributes;
}

std::string RateController::devicePath() const {
    std::lock_guard<std::mutex> lock(d->ioMutex);
    return d->channel.devicePath();
}

}
