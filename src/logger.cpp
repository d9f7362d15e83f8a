#include "slu/logger.h"
#include <ctime>
#include <iostream>
#include <stdexcept>

Logger::Logger(const std::string& path, bool to_stdout)
    : to_stdout(to_stdout), progress_pending(false) {
    if (!path.empty()) {
        file.open(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open log file: " + path);
        }
    }
}

void Logger::info(const std::string& message) {
    if (file.is_open()) {
        file << message << std::endl;
    }
    if (to_stdout) {
        if (progress_pending) {
            std::cout << std::endl;
            progress_pending = false;
        }
        std::cout << message << std::endl;
    }
}

void Logger::progress(const std::string& message) {
    if (!to_stdout) return;
    std::cout << "\r" << message << std::flush;
    progress_pending = true;
}

std::string Logger::timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[64];
    if (std::strftime(buffer, sizeof(buffer), "%a %b %d %H:%M:%S %Y", &local) == 0) {
        return "";
    }
    return buffer;
}
