#include "messaging/SpreadCardJsonSerializer.hh"

#include "main/Spread.hh"
#include "messaging/DrawnCardJsonSerializer.hh"

using nlohmann::json;

namespace Tarot {
namespace Main {

const std::string SPREAD_CARD_ROLE_KEY {"role"};

void to_json(json& j, const SpreadCard& card)
{
    j = card.card;
    j.emplace(SPREAD_CARD_ROLE_KEY, card.role);
}

void from_json(const json& j, SpreadCard& card)
{
    card.card = j.get<Engine::DrawnCard>();
    card.role = j.at(SPREAD_CARD_ROLE_KEY).get<std::string>();
}

}
}
