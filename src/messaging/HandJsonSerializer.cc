#include "messaging/HandJsonSerializer.hh"

#include "messaging/CardTypeJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"

#include <vector>

using nlohmann::json;

namespace Blackjack {

const std::string HAND_CARDS_KEY {"cards"};
const std::string HAND_BET_KEY {"bet"};
const std::string HAND_OUTCOME_KEY {"outcome"};
const std::string HAND_VALUE_KEY {"value"};

void to_json(json& j, const HandOutcome outcome)
{
    j = std::string {handOutcomeToString(outcome)};
}

void from_json(const json& j, HandOutcome& outcome)
{
    outcome = Messaging::jsonToEnum(j, handOutcomeFromString);
}

void to_json(json& j, const Hand& hand)
{
    j.emplace(HAND_CARDS_KEY, hand.getCards());
    j.emplace(HAND_BET_KEY, hand.getBet());
    j.emplace(HAND_OUTCOME_KEY, Messaging::optionalToJson(hand.getOutcome()));
    j.emplace(HAND_VALUE_KEY, hand.getBestValue());
}

void from_json(const json& j, Hand& hand)
{
    const auto bet = Messaging::validate(
        j.at(HAND_BET_KEY).get<Money>(), [](const auto b) { return b >= 0; });
    auto ret = Hand {bet};
    for (const auto& card : j.at(HAND_CARDS_KEY).get<std::vector<CardType>>()) {
        ret.addCard(card);
    }
    const auto outcome = Messaging::jsonToOptional<HandOutcome>(
        j.at(HAND_OUTCOME_KEY));
    if (outcome) {
        ret.setOutcome(*outcome);
    }
    hand = std::move(ret);
}

}
