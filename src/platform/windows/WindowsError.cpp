#include "WindowsError.hpp"
#include <QString>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace pollswitch {

std::string lastErrorMessage() {
    const DWORD code = GetLastError();

    LPWSTR buffer = nullptr;
    const DWORD length = FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, 0, reinterpret_cast<LPWSTR>(&buffer), 0, nullptr);

    QString message;
    if (length && buffer) {
        message = QString::fromWCharArray(buffer, static_cast<int>(length)).trimmed();
    }
    if (buffer) {
        LocalFree(buffer);
    }

    if (message.isEmpty()) {
        message = QStringLiteral("error");
    }
    return QString("%1 (%2)").arg(message).arg(code).toStdString();
}

}
