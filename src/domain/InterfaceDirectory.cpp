#include "domain/InterfaceDirectory.hpp"

#include <algorithm>

bool InterfaceDirectory::exists(const std::string& name) {
    auto rows = table_->snapshot();
    return std::any_of(rows.begin(), rows.end(), [&](const InterfaceEntry& e) { return e.name == name; });
}

std::optional<InterfaceInfo> InterfaceDirectory::lookup(const std::optional<std::string>& name) {
    for (auto& row : table_->snapshot()) {
        if (!row.link) continue;
        if (name) {
            if (row.name == *name) return InterfaceInfo{row.name, *row.link};
        } else if (!row.link->isZero()) {
            return InterfaceInfo{row.name, *row.link};
        }
    }
    return std::nullopt;
}
