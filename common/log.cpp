#include "log.hpp"
#include <iostream>
#include <mutex>

namespace {
std::mutex outputMutex;
}

void logInfo(const std::string& tag, const std::string& message) {
    std::string line = "[" + tag + "] " + message + "\n";
    std::lock_guard<std::mutex> guard(outputMutex);
    std::cout << line << std::flush;
}

void logError(const std::string& tag, const std::string& message) {
    std::string line = "[" + tag + "] " + message + "\n";
    std::lock_guard<std::mutex> guard(outputMutex);
    std::cerr << line << std::flush;
}
