#include "ProcessSampler.hpp"
#include <QString>

namespace pollswitch {

ProcessSnapshot::ProcessSnapshot(std::initializer_list<std::string> names) {
    for (const auto& name : names) {
        insert(name);
    }
}

void ProcessSnapshot::insert(const std::string& name) {
    if (!name.empty()) {
        names_.insert(fold(name));
    }
}

bool ProcessSnapshot::contains(const std::string& name) const {
    return names_.count(fold(name)) != 0;
}

std::string ProcessSnapshot::fold(const std::string& name) {
    return QString::fromStdString(name).toCaseFolded().toStdString();
}

}
