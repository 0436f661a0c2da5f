// meter/logger.cpp
#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

std::mutex Logger::write_mutex;
std::atomic<bool> Logger::verbose{false};

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
    return ss.str();
}

void Logger::write(const char* prefix, const std::string& msg) {
    std::string stamp = timestamp();
    std::lock_guard<std::mutex> lock(write_mutex);
    std::cout << prefix << "[" << stamp << "] ";
    std::cout << msg << std::endl;
}

void Logger::debug(const std::string& msg) {
    if (!verbose.load()) return;
    write(BLUE, std::string("[DEBUG]" RESET " ") + msg);
}

void Logger::info(const std::string& msg) {
    write(CYAN, std::string("[INFO]" RESET " ") + msg);
}

void Logger::success(const std::string& msg) {
    write(GREEN, std::string("[OK]" RESET " ") + msg);
}

void Logger::warning(const std::string& msg) {
    write(YELLOW, std::string("[WARN]" RESET " ") + msg);
}

void Logger::error(const std::string& msg) {
    write(RED, std::string("[ERROR]" RESET " ") + msg);
}
