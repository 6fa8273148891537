#pragma once
#include <string>

namespace pollswitch {

// Text of GetLastError(), e.g. "Access is denied. (5)".
std::string lastErrorMessage();

}
