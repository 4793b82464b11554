#pragma once
#include <string>

// Tagged console output shared by listener, client and sync threads.
// Each line is built first and written in one piece.
void logInfo(const std::string& tag, const std::string& message);
void logError(const std::string& tag, const std::string& message);
