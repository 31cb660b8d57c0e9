#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include "ks_logger.h"

namespace {
    // Comparator workers log concurrently
    std::mutex logMutex;
}

// Function to log messages to both a log file and console
void logMessage(const std::string& message, std::ofstream& logFile) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cout << message << std::endl;
    if (logFile.is_open()) {
        logFile << message << std::endl;
    }
}

// Function to clear log file
void logClear(const std::string& logPath) {
    std::ofstream ofs(logPath, std::ofstream::trunc);
    ofs.close();
}

// Function to format the current UTC time
std::string currentTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    return out.str();
}

// Function to log errors, close the log file and terminate the program
[[noreturn]] void logErrorAndExit(const std::string& errorMessage, std::ofstream& logFile) {
    {
        std::lock_guard<std::mutex> lock(logMutex);
        std::cerr << errorMessage;
        if (logFile.is_open()) {
            logFile << errorMessage;
            logFile.close();
        }
    }

    std::exit(EXIT_FAILURE);
}
