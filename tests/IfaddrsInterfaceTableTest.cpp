#include "infra/IfaddrsInterfaceTable.hpp"

#include <gtest/gtest.h>

#include <algorithm>

TEST(IfaddrsInterfaceTableTest, LoopbackHasZeroLinkAddress) {
    IfaddrsInterfaceTable table;
    auto rows = table.snapshot();

    auto lo = std::find_if(rows.begin(), rows.end(),
                           [](const InterfaceEntry& e) { return e.name == "lo" && e.link; });
    ASSERT_NE(lo, rows.end()) << "no AF_PACKET row for lo";
    EXPECT_TRUE(lo->link->isZero());
}

TEST(IfaddrsInterfaceTableTest, EveryRowIsNamed) {
    IfaddrsInterfaceTable table;
    for (const auto& e : table.snapshot()) EXPECT_FALSE(e.name.empty());
}

TEST(IfaddrsInterfaceTableTest, InetRowsCarryNoLinkAddress) {
    IfaddrsInterfaceTable table;
    auto rows = table.snapshot();
    // lo shows up once per family; only the AF_PACKET row carries a MAC
    auto loRows = std::count_if(rows.begin(), rows.end(), [](const InterfaceEntry& e) { return e.name == "lo"; });
    auto loLinks =
        std::count_if(rows.begin(), rows.end(), [](const InterfaceEntry& e) { return e.name == "lo" && e.link; });
    EXPECT_EQ(loLinks, 1);
    EXPECT_GE(loRows, loLinks);
}
