// src/common/session_id_generator.cpp
#include "common/session_id_generator.h"
#include <chrono>
#include <ctime>
#include <random>
#include <sstream>
#include <iomanip>

namespace photobooth::common {

std::string SessionIdGenerator::generate() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y%m%d-%H%M%S") << "-";
    ss << std::hex;
    for (int i = 0; i < 6; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

} // namespace photobooth::common
