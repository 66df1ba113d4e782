#include "messaging/DrawnCardJsonSerializer.hh"

#include "engine/DrawEngine.hh"
#include "messaging/SerializationFailureException.hh"

using nlohmann::json;

namespace Tarot {

namespace Engine {

const std::string DRAWN_CARD_INDEX_KEY {"index"};
const std::string DRAWN_CARD_NAME_KEY {"card"};
const std::string DRAWN_CARD_CHINESE_NAME_KEY {"chineseName"};
const std::string DRAWN_CARD_JAPANESE_NAME_KEY {"japaneseName"};
const std::string DRAWN_CARD_ORIENTATION_KEY {"orientation"};
const std::string DRAWN_CARD_MEANING_KEY {"meaning"};

void to_json(json& j, const DrawnCard& card)
{
    j = json::object();
    j.emplace(DRAWN_CARD_INDEX_KEY, card.index);
    j.emplace(DRAWN_CARD_NAME_KEY, card.name);
    j.emplace(DRAWN_CARD_CHINESE_NAME_KEY, card.chineseName);
    j.emplace(DRAWN_CARD_JAPANESE_NAME_KEY, card.japaneseName);
    j.emplace(DRAWN_CARD_ORIENTATION_KEY, card.orientation);
    j.emplace(DRAWN_CARD_MEANING_KEY, card.meaning);
}

void from_json(const json& j, DrawnCard& card)
{
    card.index = j.at(DRAWN_CARD_INDEX_KEY).get<int>();
    card.name = j.at(DRAWN_CARD_NAME_KEY).get<std::string>();
    card.chineseName = j.at(DRAWN_CARD_CHINESE_NAME_KEY).get<std::string>();
    card.japaneseName = j.at(DRAWN_CARD_JAPANESE_NAME_KEY).get<std::string>();
    card.orientation = j.at(DRAWN_CARD_ORIENTATION_KEY).get<Orientation>();
    card.meaning = j.at(DRAWN_CARD_MEANING_KEY).get<std::string>();
}

}

void to_json(json& j, const Orientation orientation)
{
    j = std::string {orientationName(orientation)};
}

void from_json(const json& j, Orientation& orientation)
{
    if (!j.is_string()) {
        throw Messaging::SerializationFailureException {
            "Expected orientation to be string"};
    }
    const auto& name = j.get_ref<const json::string_t&>();
    if (const auto parsed = orientationFromName(name)) {
        orientation = *parsed;
    } else {
        throw Messaging::SerializationFailureException {
            "Unknown orientation: " + name};
    }
}

}
