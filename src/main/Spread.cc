#include "main/Spread.hh"

#include <array>
#include <ostream>
#include <string_view>
#include <tuple>
#include <utility>

namespace Tarot {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto SPREAD_ROLES = std::array {
    "past"sv,
    "present"sv,
    "future"sv,
};

}

bool operator==(const SpreadCard& lhs, const SpreadCard& rhs)
{
    return std::tie(lhs.card, lhs.role) == std::tie(rhs.card, rhs.role);
}

std::ostream& operator<<(std::ostream& os, const SpreadCard& card)
{
    return os << card.role << ": " << card.card;
}

std::string getSpreadRole(const std::size_t n)
{
    if (n < SPREAD_ROLES.size()) {
        return std::string {SPREAD_ROLES[n]};
    }
    return "pos" + std::to_string(n);
}

std::vector<SpreadCard> tagSpread(Engine::DrawResult cards)
{
    auto ret = std::vector<SpreadCard> {};
    ret.reserve(cards.size());
    for (auto n = 0u; n < cards.size(); ++n) {
        ret.push_back(SpreadCard {std::move(cards[n]), getSpreadRole(n)});
    }
    return ret;
}

}
}
