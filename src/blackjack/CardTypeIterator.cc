#include "blackjack/CardTypeIterator.hh"

#include "blackjack/BlackjackConstants.hh"

#include <stdexcept>

namespace Blackjack {

int cardTypeIndex(const CardType& card)
{
    return static_cast<int>(card.rank) * N_SUITS + static_cast<int>(card.suit);
}

CardType enumerateCardType(const int n)
{
    if (n < 0 || n >= N_CARDS_PER_DECK) {
        throw std::invalid_argument {"Invalid card type index"};
    }
    return {static_cast<Rank>(n / N_SUITS), static_cast<Suit>(n % N_SUITS)};
}

}
