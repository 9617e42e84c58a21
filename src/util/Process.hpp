#pragma once

#include <string>
#include <vector>

// Whitespace-separated words, no quoting rules.
std::vector<std::string> splitWords(const std::string& s);
std::string shellQuote(const std::string& arg);
std::string joinCommand(const std::vector<std::string>& argv);

// Runs argv through the shell with stderr merged into `output`. Returns the
// exit status; throws std::system_error if the shell cannot be spawned.
int runCmdCapture(const std::vector<std::string>& argv, std::string& output);
bool hasCmd(const std::string& name);
