#pragma once
#include <fstream>
#include <string>

// Log messages to both a log file and console
void logMessage(const std::string& message, std::ofstream& logFile);

// Clear log file
void logClear(const std::string& logPath);

// Current UTC time in ISO-8601 form (YYYY-MM-DDTHH:MM:SS)
std::string currentTimestamp();

// Log errors, close the log file and terminate the program
[[noreturn]] void logErrorAndExit(const std::string& errorMessage, std::ofstream& logFile);
