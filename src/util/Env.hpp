#pragma once

#include <filesystem>
#include <string>

// KEY=VALUE lines; never overrides variables already set. Returns the number
// of keys taken from the file.
int loadDotenv(const std::filesystem::path& dotenvPath);
std::string getenvOr(const std::string& key, const std::string& defVal);
bool getenvFlag(const std::string& key, bool defVal);
