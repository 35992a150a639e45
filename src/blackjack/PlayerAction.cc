#include "blackjack/PlayerAction.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/bimap/bimap.hpp>
#include <boost/bimap/multiset_of.hpp>

#include <ostream>
#include <string>

namespace Blackjack {

namespace {

using PlayerActionToStringMap = boost::bimaps::bimap<PlayerAction, std::string>;

const auto PLAYER_ACTION_TO_STRING_MAP = []()
{
    auto ret = PlayerActionToStringMap {};
    using Relation = PlayerActionToStringMap::value_type;
    ret.insert(Relation {PlayerAction::HIT, "HIT"});
    ret.insert(Relation {PlayerAction::STAND, "STAND"});
    ret.insert(Relation {PlayerAction::DOUBLE, "DOUBLE"});
    ret.insert(Relation {PlayerAction::SPLIT, "SPLIT"});
    return ret;
}();

// Each action has a short and a long token
using PlayerActionTokenMap = boost::bimaps::bimap<
    boost::bimaps::multiset_of<PlayerAction>, std::string>;

const auto PLAYER_ACTION_TOKEN_MAP = []()
{
    auto ret = PlayerActionTokenMap {};
    using Relation = PlayerActionTokenMap::value_type;
    ret.insert(Relation {PlayerAction::HIT, "h"});
    ret.insert(Relation {PlayerAction::HIT, "hit"});
    ret.insert(Relation {PlayerAction::STAND, "s"});
    ret.insert(Relation {PlayerAction::STAND, "stand"});
    ret.insert(Relation {PlayerAction::DOUBLE, "d"});
    ret.insert(Relation {PlayerAction::DOUBLE, "double"});
    ret.insert(Relation {PlayerAction::SPLIT, "p"});
    ret.insert(Relation {PlayerAction::SPLIT, "split"});
    return ret;
}();

}

std::optional<PlayerAction> playerActionFromString(const std::string_view str)
{
    const auto token = boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy(std::string {str}));
    const auto iter = PLAYER_ACTION_TOKEN_MAP.right.find(token);
    if (iter == PLAYER_ACTION_TOKEN_MAP.right.end()) {
        return std::nullopt;
    }
    return iter->second;
}

std::string_view playerActionToString(const PlayerAction action)
{
    return PLAYER_ACTION_TO_STRING_MAP.left.at(action);
}

std::ostream& operator<<(std::ostream& os, const PlayerAction action)
{
    return os << playerActionToString(action);
}

}
