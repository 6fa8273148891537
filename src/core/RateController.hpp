#pragma once
#include <pollswitch/Types.hpp>
#include <memory>
#include <string>

namespace pollswitch {

class HidBackend;

// Public contract over the locate/open/encode/send sequence. All calls are
// serialised, so the watcher thread and a manual caller never write to the
// handle at the same time.
class RateController {
public:
    explicit RateController(HidBackend& backend,
                            const DeviceIdentity& identity = TARGET_DEVICE);
    ~RateController();

    RateController(const RateController&) = delete;
    RateController& operator=(const RateController&) = delete;

    // Throws EnumerationError, DeviceNotFoundError or DeviceOpenError and
    // stays unconnected on failure.
    void connectDevice();

    // Sends the command as a feature report, then as an output report if the
    // first attempt is rejected. Throws UnsupportedRateError before any I/O,
    // NotConnectedError, or TransmissionError when both paths fail.
    TransmissionPath setRate(int rate);

    // Throws NotConnectedError.
    void testConnection() const;

    void close();

    bool isConnected() const;
    DeviceAttributes attributes() const;
    std::string devicePath() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
