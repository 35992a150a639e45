#include "blackjack/GameSettings.hh"

#include <boost/algorithm/string/trim.hpp>

#include <ostream>
#include <stdexcept>
#include <utility>

namespace Blackjack {

GameSettings::GameSettings(
    std::string playerName, const int deckCount, const Money initialBankroll,
    const std::chrono::milliseconds shoeChangeDelay) :
    playerName {std::move(playerName)},
    deckCount {deckCount},
    initialBankroll {initialBankroll},
    shoeChangeDelay {shoeChangeDelay}
{
}

GameSettings GameSettings::defaultSinglePlayer(std::string playerName)
{
    return GameSettings {std::move(playerName), DEFAULT_DECK_COUNT};
}

void GameSettings::validate() const
{
    if (boost::algorithm::trim_copy(playerName).empty()) {
        throw std::invalid_argument {"Player name cannot be empty"};
    }
    if (deckCount < MIN_DECKS || deckCount > MAX_DECKS) {
        throw std::invalid_argument {"Deck count must be between 1 and 8"};
    }
    if (!(initialBankroll >= 0)) {
        throw std::invalid_argument {"Initial bankroll cannot be negative"};
    }
    if (shoeChangeDelay.count() < 0) {
        throw std::invalid_argument {"Shoe change delay cannot be negative"};
    }
}

std::ostream& operator<<(std::ostream& os, const GameSettings& settings)
{
    return os << "player " << settings.playerName << ", " <<
        settings.deckCount << " decks, bankroll " <<
        settings.initialBankroll << ", shoe change delay " <<
        settings.shoeChangeDelay.count() << " ms";
}

}
