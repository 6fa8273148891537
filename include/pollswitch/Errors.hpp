#pragma once
#include "Constants.hpp"
#include <stdexcept>
#include <string>

namespace pollswitch {

class Error : public std::runtime_error {
public:
    Error(int code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

class EnumerationError : public Error {
public:
    explicit EnumerationError(const std::string& message)
        : Error(ErrorCodes::ENUMERATION_FAILED, message) {}
};

class DeviceNotFoundError : public Error {
public:
    explicit DeviceNotFoundError(const std::string& message)
        : Error(ErrorCodes::DEVICE_NOT_FOUND, message) {}
};

class DeviceOpenError : public Error {
public:
    explicit DeviceOpenError(const std::string& message)
        : Error(ErrorCodes::DEVICE_OPEN_FAILED, message) {}
};

class UnsupportedRateError : public Error {
public:
    explicit UnsupportedRateError(int rate)
        : Error(ErrorCodes::UNSUPPORTED_RATE,
                "Unsupported polling rate: " + std::to_string(rate))
        , rate_(rate) {}

    int rate() const { return rate_; }

private:
    int rate_;
};

// Both the feature report and the output report write were rejected.
class TransmissionError : public Error {
public:
    TransmissionError(const std::string& featureError, const std::string& outputError)
        : Error(ErrorCodes::TRANSMISSION_FAILED,
                "Failed to send command (feature report: " + featureError +
                "; output report: " + outputError + ")")
        , featureError_(featureError)
        , outputError_(outputError) {}

    const std::string& featureError() const { return featureError_; }
    const std::string& outputError() const { return outputError_; }

private:
    std::string featureError_;
    std::string outputError_;
};

class NotConnectedError : public Error {
public:
    NotConnectedError()
        : Error(ErrorCodes::NOT_CONNECTED, "Device not connected") {}
};

class ProcessListError : public Error {
public:
    explicit ProcessListError(const std::string& message)
        : Error(ErrorCodes::PROCESS_LIST_UNAVAILABLE, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorCodes::CONFIG_ERROR, message) {}
};

}
