#include "messaging/CardTypeJsonSerializer.hh"

#include "messaging/JsonSerializerUtility.hh"

using nlohmann::json;

namespace Blackjack {

const std::string CARD_TYPE_RANK_KEY {"rank"};
const std::string CARD_TYPE_SUIT_KEY {"suit"};

void to_json(json& j, const Rank rank)
{
    j = std::string {rankToString(rank)};
}

void from_json(const json& j, Rank& rank)
{
    rank = Messaging::jsonToEnum(j, rankFromString);
}

void to_json(json& j, const Suit suit)
{
    j = std::string {suitToString(suit)};
}

void from_json(const json& j, Suit& suit)
{
    suit = Messaging::jsonToEnum(j, suitFromString);
}

void to_json(json& j, const CardType& cardType)
{
    j.emplace(CARD_TYPE_RANK_KEY, cardType.rank);
    j.emplace(CARD_TYPE_SUIT_KEY, cardType.suit);
}

void from_json(const json& j, CardType& cardType)
{
    cardType.rank = j.at(CARD_TYPE_RANK_KEY).get<Rank>();
    cardType.suit = j.at(CARD_TYPE_SUIT_KEY).get<Suit>();
}

}
