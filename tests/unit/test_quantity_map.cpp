/**
 * @file test_quantity_map.cpp
 * @brief Unit tests for QuantityMap
 */

#include <gtest/gtest.h>
#include "QuantityMap.hpp"
#include <stdexcept>

using namespace QTRACK;

TEST(QuantityMapTest, KeepsInsertionOrder) {
    QuantityMap map;
    map.set("thickness", TrackedQuantity(12.7, "mm"));
    map.set("diameter", TrackedQuantity(20.0, "in"));
    map.set("pressure", TrackedQuantity(15.0, "MPa"));

    EXPECT_EQ(map.names(), (std::vector<std::string>{"thickness", "diameter", "pressure"}));
    EXPECT_EQ(map.size(), 3u);
    EXPECT_EQ(map.begin()->first, "thickness");
}

TEST(QuantityMapTest, OverwriteKeepsPosition) {
    QuantityMap map;
    map.set("a", TrackedQuantity(1.0, "m"));
    map.set("b", TrackedQuantity(2.0, "m"));
    map.set("a", TrackedQuantity(3.0, "ft"));

    EXPECT_EQ(map.names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(map.at("a").unitString(), "ft");
    EXPECT_DOUBLE_EQ(map.at("a").value(), 3.0);
}

TEST(QuantityMapTest, Lookup) {
    QuantityMap map;
    EXPECT_TRUE(map.empty());
    map.set("depth", TrackedQuantity(10.0, "m"));

    EXPECT_TRUE(map.contains("depth"));
    EXPECT_FALSE(map.contains("Depth"));
    EXPECT_NE(map.find("depth"), nullptr);
    EXPECT_EQ(map.find("missing"), nullptr);
    EXPECT_THROW(map.at("missing"), std::out_of_range);
}
