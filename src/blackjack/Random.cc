#include "blackjack/Random.hh"

namespace Blackjack {

Rng& getRng()
{
    // Seeded once from the OS random number source
    static Rng randomEngine {std::random_device()()};
    return randomEngine;
}

}
