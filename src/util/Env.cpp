#include "util/Env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace {
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
        return v.substr(1, v.size() - 2);
    return v;
}
}  // namespace

int loadDotenv(const std::filesystem::path& dotenvPath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dotenvPath, ec)) return 0;

    std::ifstream in(dotenvPath);
    if (!in.is_open()) return 0;

    int loaded = 0;
    for (std::string line; std::getline(in, line);) {
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (s.compare(0, 7, "export ") == 0) s = trim(s.substr(7));
        auto pos = s.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(s.substr(0, pos));
        if (key.empty() || std::getenv(key.c_str())) continue;
        std::string val = unquote(trim(s.substr(pos + 1)));
        if (setenv(key.c_str(), val.c_str(), 0) == 0) ++loaded;
    }
    return loaded;
}

std::string getenvOr(const std::string& key, const std::string& defVal) {
    const char* v = std::getenv(key.c_str());
    return v ? std::string(v) : defVal;
}

bool getenvFlag(const std::string& key, bool defVal) {
    const char* v = std::getenv(key.c_str());
    if (!v) return defVal;
    std::string s = trim(v);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off" || s.empty()) return false;
    return defVal;
}
