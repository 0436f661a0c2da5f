// meter/logger.hpp
#pragma once
#include <string>
#include <atomic>
#include <mutex>

#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define BLUE    "\033[34m"
#define CYAN    "\033[36m"
#define BOLD    "\033[1m"

class Logger {
private:
    static std::mutex write_mutex;
    static std::atomic<bool> verbose;

    static void write(const char* prefix, const std::string& msg);

public:
    static std::string timestamp();
    static void set_verbose(bool enabled) { verbose.store(enabled); }
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void success(const std::string& msg);
    static void warning(const std::string& msg);
    static void error(const std::string& msg);
};
