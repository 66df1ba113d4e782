#include "main/Spread.hh"

#include <gtest/gtest.h>

#include <string>

using Tarot::Engine::DrawnCard;
using Tarot::Main::SpreadCard;
using Tarot::Orientation;

namespace {

DrawnCard makeCard(const int index)
{
    return DrawnCard {
        index, "card" + std::to_string(index), "", "", Orientation::REVERSED,
        "meaning"};
}

}

TEST(SpreadTest, testRoles)
{
    EXPECT_EQ("past", Tarot::Main::getSpreadRole(0));
    EXPECT_EQ("present", Tarot::Main::getSpreadRole(1));
    EXPECT_EQ("future", Tarot::Main::getSpreadRole(2));
    EXPECT_EQ("pos3", Tarot::Main::getSpreadRole(3));
    EXPECT_EQ("pos10", Tarot::Main::getSpreadRole(10));
}

TEST(SpreadTest, testTagSpreadKeepsPickOrder)
{
    const auto spread = Tarot::Main::tagSpread({
        makeCard(5), makeCard(0), makeCard(13)});
    ASSERT_EQ(3u, spread.size());
    EXPECT_EQ((SpreadCard {makeCard(5), "past"}), spread[0]);
    EXPECT_EQ((SpreadCard {makeCard(0), "present"}), spread[1]);
    EXPECT_EQ((SpreadCard {makeCard(13), "future"}), spread[2]);
}

TEST(SpreadTest, testTagSpreadWithExtraCards)
{
    const auto spread = Tarot::Main::tagSpread({
        makeCard(1), makeCard(2), makeCard(3), makeCard(4)});
    ASSERT_EQ(4u, spread.size());
    EXPECT_EQ("pos3", spread[3].role);
}

TEST(SpreadTest, testTagEmptySpread)
{
    EXPECT_TRUE(Tarot::Main::tagSpread({}).empty());
}
