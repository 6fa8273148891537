#include "WindowsHidBackend.hpp"
#include "WindowsError.hpp"
#include "core/Logger.hpp"
#include <pollswitch/Errors.hpp>
#include <QString>
#include <vector>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <setupapi.h>
#include <hidsdi.h>

namespace pollswitch {

namespace {

std::wstring widen(const std::string& path) {
    return QString::fromStdString(path).toStdWString();
}

HANDLE openShared(const std::string& devicePath) {
    return CreateFileW(widen(devicePath).c_str(),
                       GENERIC_READ | GENERIC_WRITE,
                       FILE_SHARE_READ | FILE_SHARE_WRITE,
                       nullptr,
                       OPEN_EXISTING,
                       0,
                       nullptr);
}

struct HandleCloser {
    void operator()(HANDLE handle) const {
        if (handle && handle != INVALID_HANDLE_VALUE) {
            CloseHandle(handle);
        }
    }
};
using ScopedHandle = std::unique_ptr<void, HandleCloser>;

struct DeviceInfoListDeleter {
    void operator()(HDEVINFO info) const {
        SetupDiDestroyDeviceInfoList(info);
    }
};
using ScopedDeviceInfoList = std::unique_ptr<void, DeviceInfoListDeleter>;

// Resolves the interface path with the usual size query followed by the
// real call. An empty result means the interface has to be skipped.
std::string interfacePath(HDEVINFO devInfo, SP_DEVICE_INTERFACE_DATA& interfaceData) {
    DWORD requiredSize = 0;
    SetupDiGetDeviceInterfaceDetailW(devInfo, &interfaceData, nullptr, 0, &requiredSize, nullptr);
    if (requiredSize < sizeof(SP_DEVICE_INTERFACE_DETAIL_DATA_W)) {
        return {};
    }

    std::vector<BYTE> buffer(requiredSize);
    auto detail = reinterpret_cast<PSP_DEVICE_INTERFACE_DETAIL_DATA_W>(buffer.data());
    detail->cbSize = sizeof(SP_DEVICE_INTERFACE_DETAIL_DATA_W);

    if (!SetupDiGetDeviceInterfaceDetailW(devInfo, &interfaceData, detail,
                                          requiredSize, nullptr, nullptr)) {
        return {};
    }
    return QString::fromWCharArray(detail->DevicePath).toStdString();
}

class WindowsHidConnection : public HidConnection {
public:
    explicit WindowsHidConnection(HANDLE handle)
        : handle_(handle) {}

    ~WindowsHidConnection() override {
        close();
    }

    IoResult sendFeatureReport(const Report& report) override {
        IoResult result;
        if (!isOpen()) {
            result.error = "handle closed";
            return result;
        }

        Report buffer = report;
        if (HidD_SetFeature(handle_, buffer.data(), static_cast<ULONG>(buffer.size()))) {
            result.ok = true;
            result.bytesTransferred = buffer.size();
        } else {
            result.error = lastErrorMessage();
        }
        return result;
    }

    IoResult writeOutputReport(const Report& report) override {
        IoResult result;
        if (!isOpen()) {
            result.error = "handle closed";
            return result;
        }

        DWORD written = 0;
        if (WriteFile(handle_, report.data(), static_cast<DWORD>(report.size()),
                      &written, nullptr)) {
            result.ok = true;
            result.bytesTransferred = written;
        } else {
            result.error = lastErrorMessage();
        }
        return result;
    }

    void close() override {
        if (handle_ != INVALID_HANDLE_VALUE) {
            CloseHandle(handle_);
            handle_ = INVALID_HANDLE_VALUE;
        }
    }

    bool isOpen() const override {
        return handle_ != INVALID_HANDLE_VALUE;
    }

private:
    HANDLE handle_;
};

} // namespace

void WindowsHidBackend::enumerateInterfaces(const InterfaceVisitor& visitor) {
    GUID hidGuid;
    HidD_GetHidGuid(&hidGuid);

    HDEVINFO devInfo = SetupDiGetClassDevsW(&hidGuid, nullptr, nullptr,
                                            DIGCF_PRESENT | DIGCF_DEVICEINTERFACE);
    if (devInfo == INVALID_HANDLE_VALUE) {
        throw EnumerationError("Failed to get HID device list: " + lastErrorMessage());
    }
    ScopedDeviceInfoList guard(devInfo);

    SP_DEVICE_INTERFACE_DATA interfaceData{};
    interfaceData.cbSize = sizeof(SP_DEVICE_INTERFACE_DATA);

    for (DWORD index = 0;
         SetupDiEnumDeviceInterfaces(devInfo, nullptr, &hidGuid, index, &interfaceData);
         ++index) {
        const std::string path = interfacePath(devInfo, interfaceData);
        if (path.empty()) {
            continue;
        }
        if (!visitor(path)) {
            return;
        }
    }

    if (GetLastError() != ERROR_NO_MORE_ITEMS) {
        POLLSWITCH_LOG_DEBUG("Interface enumeration ended early: " + lastErrorMessage());
    }
}

std::optional<DeviceAttributes> WindowsHidBackend::queryAttributes(const std::string& devicePath) {
    ScopedHandle handle(openShared(devicePath));
    if (handle.get() == INVALID_HANDLE_VALUE) {
        return std::nullopt;
    }

    HIDD_ATTRIBUTES attributes{};
    attributes.Size = sizeof(HIDD_ATTRIBUTES);
    if (!HidD_GetAttributes(handle.get(), &attributes)) {
        return std::nullopt;
    }

    DeviceAttributes result;
    result.vendorId = attributes.VendorID;
    result.productId = attributes.ProductID;
    result.versionNumber = attributes.VersionNumber;
    return result;
}

std::unique_ptr<HidConnection> WindowsHidBackend::openHandle(const std::string& devicePath) {
    HANDLE handle = openShared(devicePath);
    if (handle == INVALID_HANDLE_VALUE) {
        throw DeviceOpenError("Failed to open device " + devicePath + ": " + lastErrorMessage());
    }
    return std::make_unique<WindowsHidConnection>(handle);
}

}
