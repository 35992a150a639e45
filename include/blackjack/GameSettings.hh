/** \file
 *
 * \brief Definition of Blackjack::GameSettings struct
 */

#ifndef BLACKJACK_GAMESETTINGS_HH_
#define BLACKJACK_GAMESETTINGS_HH_

#include "blackjack/BlackjackConstants.hh"

#include <chrono>
#include <iosfwd>
#include <string>

namespace Blackjack {

/** \brief Blackjack game configuration
 *
 * GameSettings is the intermediate representation of a game configuration,
 * coming from the command line, a settings dialog or similar, that is used
 * to set up a game engine. The settings are not validated on construction;
 * the engine validates them before use.
 */
struct GameSettings {

    /** \brief Deck count of the single player preset
     */
    static constexpr auto DEFAULT_DECK_COUNT = 6;

    /** \brief Default pause after the shoe has been replenished
     */
    static constexpr auto DEFAULT_SHOE_CHANGE_DELAY =
        std::chrono::milliseconds {2000};

    /** \brief Create settings
     *
     * \param playerName see \ref playerName
     * \param deckCount see \ref deckCount
     * \param initialBankroll see \ref initialBankroll
     * \param shoeChangeDelay see \ref shoeChangeDelay
     */
    GameSettings(
        std::string playerName, int deckCount,
        Money initialBankroll = DEFAULT_BANKROLL,
        std::chrono::milliseconds shoeChangeDelay = DEFAULT_SHOE_CHANGE_DELAY);

    /** \brief Create settings for the single player preset
     *
     * \param playerName the name of the player
     *
     * \return settings with \ref DEFAULT_DECK_COUNT decks and default
     * bankroll and shoe change delay
     */
    static GameSettings defaultSinglePlayer(std::string playerName);

    /** \brief Validate the settings
     *
     * \throw std::invalid_argument if the player name is empty (ignoring
     * whitespace), the deck count is not between MIN_DECKS and MAX_DECKS, the
     * initial bankroll is negative or the shoe change delay is negative
     */
    void validate() const;

    /// \brief Equality operator
    bool operator==(const GameSettings&) const = default;

    std::string playerName;  ///< \brief Name of the player
    int deckCount;           ///< \brief Number of decks in the shoe
    Money initialBankroll;   ///< \brief Bankroll of the player at start
    /** \brief Pause emulating the physical shoe change
     *
     * Zero disables the pause.
     */
    std::chrono::milliseconds shoeChangeDelay;
};

/** \brief Output GameSettings to stream
 */
std::ostream& operator<<(std::ostream& os, const GameSettings& settings);

}

#endif // BLACKJACK_GAMESETTINGS_HH_
