#include "messaging/RoundStateJsonSerializer.hh"

#include "messaging/HandJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"

#include <vector>

using nlohmann::json;

namespace Blackjack {

const std::string ROUND_STATE_PHASE_KEY {"phase"};
const std::string ROUND_STATE_BANKROLL_KEY {"bankroll"};
const std::string ROUND_STATE_BET_KEY {"bet"};
const std::string ROUND_STATE_DEALER_HAND_KEY {"dealerHand"};
const std::string ROUND_STATE_PLAYER_HANDS_KEY {"playerHands"};
const std::string ROUND_STATE_ACTIVE_HAND_INDEX_KEY {"activeHandIndex"};

void to_json(json& j, const RoundPhase phase)
{
    j = ROUND_PHASE_TO_STRING_MAP.left.at(phase);
}

void from_json(const json& j, RoundPhase& phase)
{
    phase = Messaging::jsonToEnum(
        j, [](const auto& str) -> std::optional<RoundPhase>
        {
            const auto iter = ROUND_PHASE_TO_STRING_MAP.right.find(str);
            if (iter != ROUND_PHASE_TO_STRING_MAP.right.end()) {
                return iter->second;
            }
            return std::nullopt;
        });
}

namespace {

template<typename T>
T getRequired(const json& j, const std::string& key)
{
    const auto& value = j.at(key);
    if (value.is_null()) {
        throw Messaging::SerializationFailureException {};
    }
    return value.get<T>();
}

template<typename PhaseState>
PhaseState getHandsState(const json& j)
{
    return PhaseState {
        getRequired<Hand>(j, ROUND_STATE_DEALER_HAND_KEY),
        getRequired<std::vector<Hand>>(j, ROUND_STATE_PLAYER_HANDS_KEY),
        j.at(ROUND_STATE_BANKROLL_KEY).get<Money>(),
    };
}

}

}

namespace nlohmann {

void adl_serializer<Blackjack::RoundState>::to_json(
    json& j, const Blackjack::RoundState& state)
{
    using namespace Blackjack;
    j.emplace(ROUND_STATE_PHASE_KEY, getPhase(state));
    j.emplace(ROUND_STATE_BANKROLL_KEY, getBankroll(state));
    j.emplace(ROUND_STATE_BET_KEY, Messaging::optionalToJson(getBet(state)));
    const auto* dealer_hand = getDealerHand(state);
    j.emplace(
        ROUND_STATE_DEALER_HAND_KEY,
        dealer_hand ? json(*dealer_hand) : json(nullptr));
    const auto* player_hands = getPlayerHands(state);
    j.emplace(
        ROUND_STATE_PLAYER_HANDS_KEY,
        player_hands ? json(*player_hands) : json(nullptr));
    j.emplace(
        ROUND_STATE_ACTIVE_HAND_INDEX_KEY,
        Messaging::optionalToJson(getActiveHandIndex(state)));
}

void adl_serializer<Blackjack::RoundState>::from_json(
    const json& j, Blackjack::RoundState& state)
{
    using namespace Blackjack;
    switch (j.at(ROUND_STATE_PHASE_KEY).get<RoundPhase>()) {
    case RoundPhase::WAITING_FOR_BET:
        state = WaitingForBet {j.at(ROUND_STATE_BANKROLL_KEY).get<Money>()};
        break;
    case RoundPhase::WAITING_TO_DEAL:
        state = WaitingToDeal {
            getRequired<Money>(j, ROUND_STATE_BET_KEY),
            j.at(ROUND_STATE_BANKROLL_KEY).get<Money>(),
        };
        break;
    case RoundPhase::PLAYER_TURN:
        {
            auto player_turn = PlayerTurn {
                getRequired<Hand>(j, ROUND_STATE_DEALER_HAND_KEY),
                getRequired<std::vector<Hand>>(j, ROUND_STATE_PLAYER_HANDS_KEY),
                j.at(ROUND_STATE_BANKROLL_KEY).get<Money>(),
                getRequired<std::size_t>(j, ROUND_STATE_ACTIVE_HAND_INDEX_KEY),
            };
            if (player_turn.activeHandIndex >= player_turn.playerHands.size()) {
                throw Messaging::SerializationFailureException {};
            }
            state = std::move(player_turn);
        }
        break;
    case RoundPhase::DEALER_TURN:
        state = getHandsState<DealerTurn>(j);
        break;
    case RoundPhase::ROUND_COMPLETE:
        state = getHandsState<RoundComplete>(j);
        break;
    }
}

}
