#include "blackjack/CardType.hh"

#include <ostream>

namespace Blackjack {

const RankToStringMap RANK_TO_STRING_MAP = []()
{
    auto ret = RankToStringMap {};
    using Relation = RankToStringMap::value_type;
    ret.insert(Relation {Rank::TWO, "2"});
    ret.insert(Relation {Rank::THREE, "3"});
    ret.insert(Relation {Rank::FOUR, "4"});
    ret.insert(Relation {Rank::FIVE, "5"});
    ret.insert(Relation {Rank::SIX, "6"});
    ret.insert(Relation {Rank::SEVEN, "7"});
    ret.insert(Relation {Rank::EIGHT, "8"});
    ret.insert(Relation {Rank::NINE, "9"});
    ret.insert(Relation {Rank::TEN, "10"});
    ret.insert(Relation {Rank::JACK, "jack"});
    ret.insert(Relation {Rank::QUEEN, "queen"});
    ret.insert(Relation {Rank::KING, "king"});
    ret.insert(Relation {Rank::ACE, "ace"});
    return ret;
}();

const SuitToStringMap SUIT_TO_STRING_MAP = []()
{
    auto ret = SuitToStringMap {};
    using Relation = SuitToStringMap::value_type;
    ret.insert(Relation {Suit::CLUBS, "clubs"});
    ret.insert(Relation {Suit::DIAMONDS, "diamonds"});
    ret.insert(Relation {Suit::HEARTS, "hearts"});
    ret.insert(Relation {Suit::SPADES, "spades"});
    return ret;
}();

namespace {

template<typename Enum, typename StringMap>
std::optional<Enum> enumFromString(
    const StringMap& stringToEnum, const std::string_view str)
{
    const auto iter = stringToEnum.find(std::string {str});
    if (iter == stringToEnum.end()) {
        return std::nullopt;
    }
    return iter->second;
}

}

bool operator==(const CardType& lhs, const CardType& rhs)
{
    return lhs.rank == rhs.rank && lhs.suit == rhs.suit;
}

std::vector<int> getValues(const Rank rank)
{
    if (isAce(rank)) {
        return {1, 11};
    }
    return {getHardValue(rank)};
}

std::string_view rankToString(const Rank rank)
{
    return RANK_TO_STRING_MAP.left.at(rank);
}

std::string_view suitToString(const Suit suit)
{
    return SUIT_TO_STRING_MAP.left.at(suit);
}

std::optional<Rank> rankFromString(const std::string_view str)
{
    return enumFromString<Rank>(RANK_TO_STRING_MAP.right, str);
}

std::optional<Suit> suitFromString(const std::string_view str)
{
    return enumFromString<Suit>(SUIT_TO_STRING_MAP.right, str);
}

std::ostream& operator<<(std::ostream& os, const Rank rank)
{
    return os << rankToString(rank);
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << suitToString(suit);
}

std::ostream& operator<<(std::ostream& os, const CardType cardType)
{
    return os << cardType.rank << " " << cardType.suit;
}

}
