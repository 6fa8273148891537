#pragma once
#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_set>

namespace pollswitch {

// Executable names of the processes running at one instant. Lookups ignore
// case.
class ProcessSnapshot {
public:
    ProcessSnapshot() = default;
    ProcessSnapshot(std::initializer_list<std::string> names);

    void insert(const std::string& name);
    bool contains(const std::string& name) const;
    std::size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

    static std::string fold(const std::string& name);

private:
    std::unordered_set<std::string> names_;
};

class ProcessSampler {
public:
    virtual ~ProcessSampler() = default;

    // Throws ProcessListError when the process list cannot be read.
    virtual ProcessSnapshot sample() = 0;
};

}
