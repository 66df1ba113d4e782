#include "tarot/TarotCard.hh"

#include <ostream>
#include <tuple>
#include <utility>

namespace Tarot {

using namespace std::string_view_literals;

namespace {
constexpr auto UPRIGHT_NAME = "upright"sv;
constexpr auto REVERSED_NAME = "reversed"sv;
}

std::string_view orientationName(const Orientation orientation)
{
    return orientation == Orientation::UPRIGHT ? UPRIGHT_NAME : REVERSED_NAME;
}

std::optional<Orientation> orientationFromName(const std::string_view name)
{
    if (name == UPRIGHT_NAME) {
        return Orientation::UPRIGHT;
    } else if (name == REVERSED_NAME) {
        return Orientation::REVERSED;
    }
    return std::nullopt;
}

TarotCard::TarotCard() = default;

TarotCard::TarotCard(
    const int index, std::string name, std::string chineseName,
    std::string japaneseName, std::string uprightMeaning,
    std::string reversedMeaning) :
    index {index},
    name {std::move(name)},
    chineseName {std::move(chineseName)},
    japaneseName {std::move(japaneseName)},
    uprightMeaning {std::move(uprightMeaning)},
    reversedMeaning {std::move(reversedMeaning)}
{
}

const std::string& TarotCard::getMeaning(const Orientation orientation) const
{
    return orientation == Orientation::UPRIGHT ?
        uprightMeaning : reversedMeaning;
}

bool operator==(const TarotCard& lhs, const TarotCard& rhs)
{
    return std::tie(
        lhs.index, lhs.name, lhs.chineseName, lhs.japaneseName,
        lhs.uprightMeaning, lhs.reversedMeaning) ==
        std::tie(
            rhs.index, rhs.name, rhs.chineseName, rhs.japaneseName,
            rhs.uprightMeaning, rhs.reversedMeaning);
}

std::ostream& operator<<(std::ostream& os, const Orientation orientation)
{
    return os << orientationName(orientation);
}

std::ostream& operator<<(std::ostream& os, const TarotCard& card)
{
    return os << card.index << " " << card.name;
}

}
