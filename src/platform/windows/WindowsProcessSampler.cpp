#include "WindowsProcessSampler.hpp"
#include "WindowsError.hpp"
#include <pollswitch/Errors.hpp>
#include <QString>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <tlhelp32.h>

namespace pollswitch {

ProcessSnapshot WindowsProcessSampler::sample() {
    HANDLE snap = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snap == INVALID_HANDLE_VALUE) {
        throw ProcessListError("Failed to list processes: " + lastErrorMessage());
    }

    ProcessSnapshot snapshot;
    PROCESSENTRY32W entry{};
    entry.dwSize = sizeof(entry);

    if (Process32FirstW(snap, &entry)) {
        do {
            snapshot.insert(QString::fromWCharArray(entry.szExeFile).toStdString());
        } while (Process32NextW(snap, &entry));
    } else {
        const std::string reason = lastErrorMessage();
        CloseHandle(snap);
        throw ProcessListError("Failed to read process list: " + reason);
    }

    CloseHandle(snap);
    return snapshot;
}

}
