#include "util/Process.hpp"

#include <cerrno>
#include <cstdio>
#include <sstream>
#include <system_error>
#include <sys/wait.h>

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    for (std::string w; iss >> w;) words.push_back(w);
    return words;
}

std::string shellQuote(const std::string& arg) {
    std::string q = "'";
    for (char c : arg) {
        if (c == '\'')
            q += "'\\''";
        else
            q += c;
    }
    q += '\'';
    return q;
}

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& a : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += shellQuote(a);
    }
    return cmd;
}

int runCmdCapture(const std::vector<std::string>& argv, std::string& output) {
    std::string full = joinCommand(argv) + " 2>&1";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) throw std::system_error(errno, std::generic_category(), "popen: " + joinCommand(argv));
    char buf[4096];
    output.clear();
    while (fgets(buf, sizeof buf, pipe)) output += buf;
    int rc = pclose(pipe);
    if (rc == -1) throw std::system_error(errno, std::generic_category(), "pclose: " + joinCommand(argv));
    if (WIFEXITED(rc)) return WEXITSTATUS(rc);
    return rc;
}

bool hasCmd(const std::string& name) {
    std::string out;
    return runCmdCapture({"sh", "-c", "command -v " + shellQuote(name)}, out) == 0;
}
