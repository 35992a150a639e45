#include "blackjack/Hand.hh"

#include <boost/bimap/bimap.hpp>

#include <algorithm>
#include <ostream>
#include <string>

namespace Blackjack {

namespace {

using HandOutcomeToStringMap = boost::bimaps::bimap<HandOutcome, std::string>;

const auto HAND_OUTCOME_TO_STRING_MAP = []()
{
    auto ret = HandOutcomeToStringMap {};
    using Relation = HandOutcomeToStringMap::value_type;
    ret.insert(Relation {HandOutcome::WIN, "win"});
    ret.insert(Relation {HandOutcome::LOSS, "loss"});
    ret.insert(Relation {HandOutcome::PUSH, "push"});
    ret.insert(Relation {HandOutcome::BLACKJACK, "blackjack"});
    return ret;
}();

}

std::string_view handOutcomeToString(const HandOutcome outcome)
{
    return HAND_OUTCOME_TO_STRING_MAP.left.at(outcome);
}

std::optional<HandOutcome> handOutcomeFromString(const std::string_view str)
{
    const auto iter = HAND_OUTCOME_TO_STRING_MAP.right.find(std::string {str});
    if (iter == HAND_OUTCOME_TO_STRING_MAP.right.end()) {
        return std::nullopt;
    }
    return iter->second;
}

Hand::Hand() :
    Hand {Money {}}
{
}

Hand::Hand(const Money bet) :
    bet {bet}
{
}

Hand::Hand(const CardType& card, const Money bet) :
    cards {card},
    bet {bet}
{
}

void Hand::addCard(const CardType& card)
{
    cards.push_back(card);
}

std::optional<CardType> Hand::removeLastCard()
{
    if (cards.empty()) {
        return std::nullopt;
    }
    const auto card = cards.back();
    cards.pop_back();
    return card;
}

const Hand::CardVector& Hand::getCards() const
{
    return cards;
}

int Hand::getNumberOfCards() const
{
    return static_cast<int>(cards.size());
}

Money Hand::getBet() const
{
    return bet;
}

void Hand::setBet(const Money bet)
{
    this->bet = bet;
}

void Hand::doubleBet()
{
    bet *= 2;
}

std::optional<HandOutcome> Hand::getOutcome() const
{
    return outcome;
}

void Hand::setOutcome(const HandOutcome outcome)
{
    this->outcome = outcome;
}

std::vector<int> Hand::getPossibleValues() const
{
    auto hard_total = 0;
    auto n_aces = 0;
    for (const auto& card : cards) {
        if (isAce(card.rank)) {
            ++n_aces;
        } else {
            hard_total += getHardValue(card.rank);
        }
    }

    auto totals = std::vector<int> {hard_total};
    const auto ace_values = getValues(Rank::ACE);
    for (auto i = 0; i < n_aces; ++i) {
        auto branched = std::vector<int> {};
        branched.reserve(totals.size() * ace_values.size());
        for (const auto total : totals) {
            for (const auto value : ace_values) {
                branched.push_back(total + value);
            }
        }
        std::sort(branched.begin(), branched.end());
        branched.erase(
            std::unique(branched.begin(), branched.end()), branched.end());
        totals = std::move(branched);
    }
    return totals;
}

int Hand::getBestValue() const
{
    const auto values = getPossibleValues();
    const auto iter = std::find_if(
        values.rbegin(), values.rend(),
        [](const auto value) { return value <= BLACKJACK_VALUE; });
    return (iter != values.rend()) ? *iter : values.front();
}

bool Hand::isNaturalBlackjack() const
{
    return getNumberOfCards() == N_INITIAL_CARDS && isBlackjack();
}

bool Hand::isBlackjack() const
{
    return getBestValue() == BLACKJACK_VALUE;
}

bool Hand::isBusted() const
{
    const auto values = getPossibleValues();
    return std::all_of(
        values.begin(), values.end(),
        [](const auto value) { return value > BLACKJACK_VALUE; });
}

bool Hand::canSplit() const
{
    return cards.size() == 2 && cards[0].rank == cards[1].rank;
}

std::ostream& operator<<(std::ostream& os, const HandOutcome outcome)
{
    return os << handOutcomeToString(outcome);
}

std::ostream& operator<<(std::ostream& os, const Hand& hand)
{
    for (const auto& card : hand.getCards()) {
        os << card << ", ";
    }
    os << "value " << hand.getBestValue() << ", bet " << hand.getBet();
    if (const auto outcome = hand.getOutcome()) {
        os << ", " << *outcome;
    }
    return os;
}

}
