#pragma once

#include "session/DecisionEvent.hpp"
#include <mutex>
#include <ostream>

namespace vigil {

// Writes decisions as JSON lines. Safe to call from several session workers;
// each line is written whole.
class DecisionWriter {
public:
    explicit DecisionWriter(std::ostream& out) : out_(out) {}

    void Write(const DecisionEvent& decision);
    size_t LinesWritten() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    size_t lines_{0};
};

} // namespace vigil
