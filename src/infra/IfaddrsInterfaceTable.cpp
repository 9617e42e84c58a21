#include "infra/IfaddrsInterfaceTable.hpp"

#include <algorithm>
#include <cerrno>
#include <ifaddrs.h>
#include <netpacket/packet.h>
#include <sys/socket.h>
#include <system_error>

namespace {
struct IfaddrsList {
    explicit IfaddrsList(ifaddrs* head) : head_(head) {}
    ~IfaddrsList() {
        if (head_) freeifaddrs(head_);
    }
    IfaddrsList(const IfaddrsList&) = delete;
    IfaddrsList& operator=(const IfaddrsList&) = delete;

    ifaddrs* get() const { return head_; }

private:
    ifaddrs* head_;
};

MacAddress linkAddress(const sockaddr_ll& ll) {
    MacAddress::Bytes b{};
    auto n = std::min<std::size_t>(ll.sll_halen, b.size());
    std::copy_n(ll.sll_addr, n, b.begin());
    return MacAddress(b);
}
}  // namespace

std::vector<InterfaceEntry> IfaddrsInterfaceTable::snapshot() {
    ifaddrs* head = nullptr;
    if (getifaddrs(&head) != 0) throw std::system_error(errno, std::generic_category(), "getifaddrs");
    IfaddrsList list(head);

    std::vector<InterfaceEntry> rows;
    for (ifaddrs* a = list.get(); a; a = a->ifa_next) {
        InterfaceEntry e;
        e.name = a->ifa_name ? a->ifa_name : "";
        if (a->ifa_addr && a->ifa_addr->sa_family == AF_PACKET)
            e.link = linkAddress(*reinterpret_cast<const sockaddr_ll*>(a->ifa_addr));
        rows.push_back(std::move(e));
    }
    return rows;
}
