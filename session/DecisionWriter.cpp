#include "session/DecisionWriter.hpp"
#include <nlohmann/json.hpp>

namespace vigil {

void DecisionWriter::Write(const DecisionEvent& decision) {
    nlohmann::json j = decision;
    const std::string line = j.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    ++lines_;
}

size_t DecisionWriter::LinesWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

} // namespace vigil
