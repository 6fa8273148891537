#pragma once
#include "core/ProcessSampler.hpp"

namespace pollswitch {

// Toolhelp snapshot of the running processes.
class WindowsProcessSampler : public ProcessSampler {
public:
    ProcessSnapshot sample() override;
};

}
