#include "blackjack/Shoe.hh"

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/CardTypeIterator.hh"
#include "blackjack/Random.hh"
#include "Logging.hh"

#include <stdexcept>

namespace Blackjack {

namespace {

Shoe::CardVector generateDecks(const int deckCount)
{
    auto cards = Shoe::CardVector {};
    cards.reserve(static_cast<std::size_t>(deckCount) * N_CARDS_PER_DECK);
    for (auto i = 0; i < deckCount; ++i) {
        cards.insert(
            cards.end(),
            cardTypeIterator(0), cardTypeIterator(N_CARDS_PER_DECK));
    }
    return cards;
}

}

Shoe::Shoe(const int deckCount) :
    deckCount {internalCheckDeckCount(deckCount)},
    available {generateDecks(deckCount)}
{
    discarded.reserve(available.size());
}

void Shoe::shuffle()
{
    std::shuffle(available.begin(), available.end(), getRng());
}

std::optional<CardType> Shoe::drawCard()
{
    if (available.empty()) {
        log(LogLevel::WARNING, "Trying to draw from an empty shoe");
        return std::nullopt;
    }
    const auto card = available.back();
    available.pop_back();
    discarded.push_back(card);
    return card;
}

bool Shoe::ensureCardsForPlayers(const int nPlayers)
{
    const auto min_cards_needed = static_cast<std::size_t>(
        (nPlayers + 1) * N_INITIAL_CARDS * 2);
    if (available.size() < min_cards_needed) {
        log(LogLevel::INFO,
            "%d cards left in the shoe, %d needed. Replenishing.",
            available.size(), min_cards_needed);
        replenish();
        return true;
    }
    return false;
}

void Shoe::replenish()
{
    available = generateDecks(deckCount);
    discarded.clear();
    shuffle();
}

int Shoe::getDeckCount() const
{
    return deckCount;
}

const Shoe::CardVector& Shoe::getAvailableCards() const
{
    return available;
}

const Shoe::CardVector& Shoe::getDiscardedCards() const
{
    return discarded;
}

std::size_t Shoe::getNumberOfAvailableCards() const
{
    return available.size();
}

std::size_t Shoe::getNumberOfDiscardedCards() const
{
    return discarded.size();
}

int Shoe::internalCheckDeckCount(const int deckCount)
{
    if (deckCount < MIN_DECKS) {
        throw std::invalid_argument {"Shoe must contain at least one deck"};
    }
    return deckCount;
}

}
