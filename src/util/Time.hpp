#pragma once

#include <ctime>
#include <string>

std::string formatLocalTime(std::time_t t, const char* fmt);
std::string nowStr();
