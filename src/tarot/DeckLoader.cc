#include "tarot/DeckLoader.hh"

#include "IoUtility.hh"
#include "Logging.hh"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/tokenizer.hpp>

#include <filesystem>
#include <istream>
#include <iterator>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace Tarot {

namespace {

using namespace std::string_view_literals;

// Splits a CSV record into fields. A field starting with a double quote is
// quoted: separators and line breaks inside it are literal, and a doubled
// quote stands for one quote character.
class CsvSeparator {
public:
    void reset()
    {
        last = false;
    }

    template<typename InputIterator, typename Token>
    bool operator()(InputIterator& next, InputIterator end, Token& tok)
    {
        tok = Token {};
        if (next == end) {
            // A separator at the end of the record leaves one empty field
            const auto ret = last;
            last = false;
            return ret;
        }
        auto quoted = false;
        for (auto first = next; next != end; ++next) {
            const auto c = *next;
            if (quoted) {
                if (c != '"') {
                    tok += c;
                } else if (std::next(next) != end && *std::next(next) == '"') {
                    tok += c;
                    ++next;
                } else {
                    quoted = false;
                }
            } else if (c == ',') {
                ++next;
                last = true;
                return true;
            } else if (c == '"' && next == first) {
                quoted = true;
            } else {
                tok += c;
            }
        }
        last = false;
        return true;
    }

private:
    bool last {};
};

using Tokenizer = boost::tokenizer<CsvSeparator>;
using Row = std::vector<std::string>;

constexpr auto UTF8_BOM = "\xEF\xBB\xBF"sv;

enum class Column {
    INDEX,
    NAME,
    CHINESE_NAME,
    JAPANESE_NAME,
    UPRIGHT_MEANING,
    REVERSED_MEANING,
};

const auto COLUMN_NAMES = std::map<std::string_view, Column> {
    { "Index"sv, Column::INDEX },
    { "Card"sv, Column::NAME },
    { "Chinese Name"sv, Column::CHINESE_NAME },
    { "ChineseName"sv, Column::CHINESE_NAME },
    { "Japanese Name"sv, Column::JAPANESE_NAME },
    { "JapaneseName"sv, Column::JAPANESE_NAME },
    { "Upright Meaning"sv, Column::UPRIGHT_MEANING },
    { "Reversed Meaning"sv, Column::REVERSED_MEANING },
};

using ColumnPositions = std::map<Column, std::size_t>;

bool readLine(std::istream& in, std::string& line)
{
    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool isQuoteOpen(const std::string_view record)
{
    auto quoted = false;
    auto field_start = true;
    for (auto iter = record.begin(); iter != record.end(); ++iter) {
        if (quoted) {
            if (*iter == '"') {
                if (std::next(iter) != record.end() && *std::next(iter) == '"') {
                    ++iter;
                } else {
                    quoted = false;
                }
            }
        } else if (*iter == '"' && field_start) {
            quoted = true;
        }
        field_start = !quoted && *iter == ',';
    }
    return quoted;
}

// Reads one CSV record. A record continues on the following lines while a
// quoted field is open. A record still open at the end of input is dropped.
bool readRecord(std::istream& in, std::string& record)
{
    if (!readLine(in, record)) {
        return false;
    }
    auto line = std::string {};
    while (isQuoteOpen(record)) {
        if (!readLine(in, line)) {
            log(LogLevel::WARNING,
                "Skipping CSV record with unterminated quoted field");
            record.clear();
            return true;
        }
        record += '\n';
        record += line;
    }
    return true;
}

Row splitRow(const std::string& record)
{
    auto row = Row {};
    for (auto token : Tokenizer {record, CsvSeparator {}}) {
        boost::algorithm::trim(token);
        row.emplace_back(std::move(token));
    }
    return row;
}

ColumnPositions readHeader(const Row& header)
{
    auto ret = ColumnPositions {};
    for (auto n = 0u; n < header.size(); ++n) {
        const auto iter = COLUMN_NAMES.find(header[n]);
        if (iter != COLUMN_NAMES.end()) {
            // The first column of each kind is used
            ret.emplace(iter->second, n);
        }
    }
    return ret;
}

std::string getField(
    const Row& row, const ColumnPositions& positions, const Column column)
{
    const auto iter = positions.find(column);
    if (iter == positions.end() || iter->second >= row.size()) {
        return {};
    }
    return row[iter->second];
}

}

Deck loadDeck(std::istream& in)
{
    if (!in) {
        throw DeckLoadFailure {"Unable to read deck data"};
    }
    auto record = std::string {};
    if (!readRecord(in, record)) {
        if (in.bad()) {
            throw DeckLoadFailure {"Error while reading deck data"};
        }
        return Deck {};
    }
    if (std::string_view {record}.starts_with(UTF8_BOM)) {
        record.erase(0, UTF8_BOM.size());
    }
    const auto positions = readHeader(splitRow(record));

    auto cards = std::map<int, TarotCard> {};
    while (readRecord(in, record)) {
        const auto row = splitRow(record);
        auto index = 0;
        const auto index_field = getField(row, positions, Column::INDEX);
        if (!boost::conversion::try_lexical_convert(index_field, index)) {
            continue;
        }
        cards.insert_or_assign(
            index,
            TarotCard {
                index,
                getField(row, positions, Column::NAME),
                getField(row, positions, Column::CHINESE_NAME),
                getField(row, positions, Column::JAPANESE_NAME),
                getField(row, positions, Column::UPRIGHT_MEANING),
                getField(row, positions, Column::REVERSED_MEANING),
            });
    }
    if (in.bad()) {
        throw DeckLoadFailure {"Error while reading deck data"};
    }
    return Deck {std::move(cards)};
}

Deck loadDeckFromPaths(const std::vector<std::string>& paths)
{
    for (const auto& path : paths) {
        auto ec = std::error_code {};
        if (!std::filesystem::exists(path, ec)) {
            log(LogLevel::DEBUG, "Deck data not found at %s", path);
            continue;
        }
        try {
            auto deck = processStreamFromPath(
                path, [](std::istream& in) { return loadDeck(in); });
            log(LogLevel::INFO, "Loaded tarot data from %s, total cards: %d",
                path, deck.size());
            return deck;
        } catch (const DeckLoadFailure& e) {
            log(LogLevel::WARNING, "Failed to load tarot data from %s: %s",
                path, e.what());
        }
    }
    log(LogLevel::WARNING,
        "No tarot data found, the server runs without cards");
    return Deck {};
}

}
