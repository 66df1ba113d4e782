#include "tarot/Deck.hh"

#include <utility>

namespace Tarot {

Deck::Deck() = default;

Deck::Deck(std::map<int, TarotCard> cards) :
    cards(std::move(cards))
{
    for (auto& [index, card] : this->cards) {
        card.index = index;
    }
}

const TarotCard* Deck::getCard(const int index) const
{
    const auto iter = cards.find(index);
    return iter != cards.end() ? &iter->second : nullptr;
}

std::vector<int> Deck::getIndices() const
{
    auto ret = std::vector<int> {};
    ret.reserve(cards.size());
    for (const auto& entry : cards) {
        ret.push_back(entry.first);
    }
    return ret;
}

std::size_t Deck::size() const
{
    return cards.size();
}

bool Deck::empty() const
{
    return cards.empty();
}

}
