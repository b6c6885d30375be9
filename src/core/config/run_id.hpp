#pragma once
#include <random>
#include <sstream>
#include <string>

namespace agentloop::core::config {

    // "<prefix>-" followed by 8 random hex characters. Tags one engine run in
    // logs and observer events.
    inline std::string generate_run_id(const std::string& prefix = "run") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace agentloop::core::config
