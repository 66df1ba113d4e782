#include "tarot/DeckLoader.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using testing::ElementsAre;

using namespace std::string_literals;

using Tarot::DeckLoadFailure;
using Tarot::TarotCard;

namespace {

const auto HEADER =
    "Index,Card,Chinese Name,Japanese Name,Upright Meaning,Reversed Meaning\n"s;

struct DataFile {
    DataFile(const std::string& name, const std::string& content) :
        path {std::filesystem::temp_directory_path() / name}
    {
        auto out = std::ofstream {path};
        out << content;
    }

    ~DataFile()
    {
        std::filesystem::remove(path);
    }

    std::filesystem::path path;
};

}

class DeckLoaderTest : public testing::Test {
protected:
    std::istringstream in;
};

TEST_F(DeckLoaderTest, testLoadDeck)
{
    in.str(HEADER +
        "0,The Fool,愚者,愚者,New beginnings,Recklessness\n"
        "1,The Magician,魔术师,魔術師,Willpower,Manipulation\n");
    const auto deck = Tarot::loadDeck(in);
    EXPECT_THAT(deck.getIndices(), ElementsAre(0, 1));
    const auto* card = deck.getCard(1);
    ASSERT_TRUE(card);
    EXPECT_EQ(
        (TarotCard {
            1, "The Magician", "魔术师", "魔術師", "Willpower",
            "Manipulation"}),
        *card);
}

TEST_F(DeckLoaderTest, testQuotedFields)
{
    in.str(HEADER + "0,The Fool,,,\"New beginnings, spontaneity\",\"Risk\"\n");
    const auto deck = Tarot::loadDeck(in);
    const auto* card = deck.getCard(0);
    ASSERT_TRUE(card);
    EXPECT_EQ("New beginnings, spontaneity", card->uprightMeaning);
    EXPECT_EQ("Risk", card->reversedMeaning);
}

TEST_F(DeckLoaderTest, testByteOrderMarkAndWhitespace)
{
    in.str("\xEF\xBB\xBF Index , Card \r\n 3 , The Empress \r\n"s);
    const auto deck = Tarot::loadDeck(in);
    const auto* card = deck.getCard(3);
    ASSERT_TRUE(card);
    EXPECT_EQ("The Empress", card->name);
}

TEST_F(DeckLoaderTest, testAlternativeColumnNames)
{
    in.str(
        "Index,Card,ChineseName,JapaneseName\n"
        "4,The Emperor,皇帝,皇帝\n"s);
    const auto deck = Tarot::loadDeck(in);
    const auto* card = deck.getCard(4);
    ASSERT_TRUE(card);
    EXPECT_EQ("皇帝", card->chineseName);
    EXPECT_EQ("皇帝", card->japaneseName);
    EXPECT_EQ("", card->uprightMeaning);
}

TEST_F(DeckLoaderTest, testRowsWithInvalidIndexAreSkipped)
{
    in.str(HEADER +
        "zero,The Fool,,,,\n"
        ",The Fool,,,,\n"
        "1,The Magician,,,,\n");
    const auto deck = Tarot::loadDeck(in);
    EXPECT_THAT(deck.getIndices(), ElementsAre(1));
}

TEST_F(DeckLoaderTest, testDoubledQuoteInQuotedField)
{
    in.str(HEADER + "0,The Fool,,,\"Say \"\"yes\"\"\",Risk\n");
    const auto deck = Tarot::loadDeck(in);
    const auto* card = deck.getCard(0);
    ASSERT_TRUE(card);
    EXPECT_EQ("Say \"yes\"", card->uprightMeaning);
    EXPECT_EQ("Risk", card->reversedMeaning);
}

TEST_F(DeckLoaderTest, testBackslashIsLiteral)
{
    in.str(HEADER +
        "0,The Fool,,,,\n"
        "1,The Magician,,,Will\\power,Trick\n");
    const auto deck = Tarot::loadDeck(in);
    EXPECT_THAT(deck.getIndices(), ElementsAre(0, 1));
    EXPECT_EQ("Will\\power", deck.getCard(1)->uprightMeaning);
}

TEST_F(DeckLoaderTest, testLineBreakInQuotedField)
{
    in.str(HEADER +
        "2,The High Priestess,,,\"line one\nline two\",Secrets\n"
        "3,The Empress,,,Abundance,Dependence\n");
    const auto deck = Tarot::loadDeck(in);
    EXPECT_THAT(deck.getIndices(), ElementsAre(2, 3));
    const auto* card = deck.getCard(2);
    ASSERT_TRUE(card);
    EXPECT_EQ("line one\nline two", card->uprightMeaning);
    EXPECT_EQ("Secrets", card->reversedMeaning);
    EXPECT_EQ("Abundance", deck.getCard(3)->uprightMeaning);
}

TEST_F(DeckLoaderTest, testUnterminatedQuoteIsSkipped)
{
    in.str(HEADER +
        "1,The Magician,,,,\n"
        "2,The High Priestess,,,\"never closed,Secrets\n");
    const auto deck = Tarot::loadDeck(in);
    EXPECT_THAT(deck.getIndices(), ElementsAre(1));
}

TEST_F(DeckLoaderTest, testTrailingEmptyField)
{
    in.str(HEADER + "5,The Hierophant,,,Tradition,\n");
    const auto deck = Tarot::loadDeck(in);
    const auto* card = deck.getCard(5);
    ASSERT_TRUE(card);
    EXPECT_EQ("Tradition", card->uprightMeaning);
    EXPECT_EQ("", card->reversedMeaning);
}

TEST_F(DeckLoaderTest, testLastRowWins)
{
    in.str(HEADER +
        "0,The Fool,,,,\n"
        "0,Le Mat,,,,\n");
    const auto deck = Tarot::loadDeck(in);
    ASSERT_EQ(1u, deck.size());
    EXPECT_EQ("Le Mat", deck.getCard(0)->name);
}

TEST_F(DeckLoaderTest, testEmptyStream)
{
    const auto deck = Tarot::loadDeck(in);
    EXPECT_TRUE(deck.empty());
}

TEST_F(DeckLoaderTest, testHeaderOnly)
{
    in.str(HEADER);
    const auto deck = Tarot::loadDeck(in);
    EXPECT_TRUE(deck.empty());
}

TEST_F(DeckLoaderTest, testBadStream)
{
    in.setstate(std::ios::badbit);
    EXPECT_THROW(Tarot::loadDeck(in), DeckLoadFailure);
}

TEST(DeckLoaderPathsTest, testFirstExistingPathIsUsed)
{
    const auto file = DataFile {
        "tarot_deck_loader_test.csv", HEADER + "7,The Chariot,,,,\n"};
    const auto deck = Tarot::loadDeckFromPaths({
        (std::filesystem::temp_directory_path() / "missing.csv").string(),
        file.path.string()});
    EXPECT_THAT(deck.getIndices(), ElementsAre(7));
}

TEST(DeckLoaderPathsTest, testNoPathsYieldsEmptyDeck)
{
    const auto deck = Tarot::loadDeckFromPaths({
        (std::filesystem::temp_directory_path() / "missing.csv").string()});
    EXPECT_TRUE(deck.empty());
}
