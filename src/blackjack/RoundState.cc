#include "blackjack/RoundState.hh"

#include <ostream>
#include <type_traits>

namespace Blackjack {

namespace {

template<typename T>
constexpr bool HAS_HANDS =
    std::is_same_v<T, PlayerTurn> || std::is_same_v<T, DealerTurn> ||
    std::is_same_v<T, RoundComplete>;

template<typename PhaseState>
std::ostream& outputHands(std::ostream& os, const PhaseState& state)
{
    os << "dealer: " << state.dealerHand;
    auto n = 0;
    for (const auto& hand : state.playerHands) {
        os << "\nhand " << ++n << ": " << hand;
    }
    return os << "\nbankroll: " << state.bankroll;
}

}

const RoundPhaseToStringMap ROUND_PHASE_TO_STRING_MAP = []()
{
    auto ret = RoundPhaseToStringMap {};
    using Relation = RoundPhaseToStringMap::value_type;
    ret.insert(Relation {RoundPhase::WAITING_FOR_BET, "waitingForBet"});
    ret.insert(Relation {RoundPhase::WAITING_TO_DEAL, "waitingToDeal"});
    ret.insert(Relation {RoundPhase::PLAYER_TURN, "playerTurn"});
    ret.insert(Relation {RoundPhase::DEALER_TURN, "dealerTurn"});
    ret.insert(Relation {RoundPhase::ROUND_COMPLETE, "roundComplete"});
    return ret;
}();

RoundPhase getPhase(const RoundState& state)
{
    // The alternatives of RoundState are declared in the order of RoundPhase
    return static_cast<RoundPhase>(state.index());
}

Money getBankroll(const RoundState& state)
{
    return std::visit([](const auto& s) { return s.bankroll; }, state);
}

std::optional<Money> getBet(const RoundState& state)
{
    return std::visit(
        [](const auto& s) -> std::optional<Money>
        {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, WaitingToDeal>) {
                return s.bet;
            } else if constexpr (HAS_HANDS<T>) {
                if (!s.playerHands.empty()) {
                    return s.playerHands.front().getBet();
                }
            }
            return std::nullopt;
        }, state);
}

const Hand* getDealerHand(const RoundState& state)
{
    return std::visit(
        [](const auto& s) -> const Hand*
        {
            using T = std::decay_t<decltype(s)>;
            if constexpr (HAS_HANDS<T>) {
                return &s.dealerHand;
            }
            return nullptr;
        }, state);
}

const std::vector<Hand>* getPlayerHands(const RoundState& state)
{
    return std::visit(
        [](const auto& s) -> const std::vector<Hand>*
        {
            using T = std::decay_t<decltype(s)>;
            if constexpr (HAS_HANDS<T>) {
                return &s.playerHands;
            }
            return nullptr;
        }, state);
}

std::optional<std::size_t> getActiveHandIndex(const RoundState& state)
{
    if (const auto* player_turn = std::get_if<PlayerTurn>(&state)) {
        return player_turn->activeHandIndex;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const RoundPhase phase)
{
    return os << ROUND_PHASE_TO_STRING_MAP.left.at(phase);
}

std::ostream& operator<<(std::ostream& os, const WaitingForBet& state)
{
    return os << RoundPhase::WAITING_FOR_BET << "\nbankroll: " <<
        state.bankroll;
}

std::ostream& operator<<(std::ostream& os, const WaitingToDeal& state)
{
    return os << RoundPhase::WAITING_TO_DEAL << "\nbet: " << state.bet <<
        "\nbankroll: " << state.bankroll;
}

std::ostream& operator<<(std::ostream& os, const PlayerTurn& state)
{
    os << RoundPhase::PLAYER_TURN << ", hand " << state.activeHandIndex + 1 <<
        " in turn\n";
    return outputHands(os, state);
}

std::ostream& operator<<(std::ostream& os, const DealerTurn& state)
{
    os << RoundPhase::DEALER_TURN << "\n";
    return outputHands(os, state);
}

std::ostream& operator<<(std::ostream& os, const RoundComplete& state)
{
    os << RoundPhase::ROUND_COMPLETE << "\n";
    return outputHands(os, state);
}

}
