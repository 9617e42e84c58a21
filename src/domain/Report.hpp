#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct Report {
    std::string action;
    std::string timestamp;
    std::optional<std::string> iface;
    std::optional<std::string> mac;
    bool generated = false;
    std::vector<std::string> advisories;
    std::optional<std::string> error;
    int exitCode = 0;

    nlohmann::json toJson() const {
        auto orNull = [](const std::optional<std::string>& v) {
            return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
        };
        return nlohmann::json{
            {"action", action},
            {"interface", orNull(iface)},
            {"mac", orNull(mac)},
            {"generated", generated},
            {"advisories", advisories},
            {"error", orNull(error)},
            {"timestamp", timestamp},
        };
    }
};
