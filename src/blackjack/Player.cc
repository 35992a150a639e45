#include "blackjack/Player.hh"

#include "Utility.hh"

#include <algorithm>
#include <iterator>

namespace Blackjack {

Player::Player(const Money bankroll) :
    hands(1),
    bankroll {bankroll}
{
}

const Player::HandVector& Player::getHands() const
{
    return hands;
}

std::size_t Player::getNumberOfHands() const
{
    return hands.size();
}

const Hand& Player::getHand(const std::size_t n) const
{
    return hands.at(n);
}

Hand& Player::getHand(const std::size_t n)
{
    return hands.at(n);
}

bool Player::addCardToHand(const CardType& card, const std::size_t n)
{
    if (n >= hands.size()) {
        return false;
    }
    hands[n].addCard(card);
    return true;
}

void Player::insertHand(const std::size_t n, Hand hand)
{
    checkIndex(n, hands.size() + 1);
    hands.insert(
        std::next(hands.begin(), static_cast<HandVector::difference_type>(n)),
        std::move(hand));
}

bool Player::hasLiveHands() const
{
    return std::any_of(
        hands.begin(), hands.end(),
        [](const auto& hand) { return !hand.isBusted(); });
}

void Player::resetHands()
{
    hands = HandVector(1);
}

Money Player::getBankroll() const
{
    return bankroll;
}

void Player::debit(const Money amount)
{
    bankroll -= amount;
}

void Player::credit(const Money amount)
{
    bankroll += amount;
}

}
