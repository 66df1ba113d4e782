#include "tarot/Random.hh"

namespace Tarot {

Rng& getRng()
{
    thread_local Rng randomEngine {std::random_device()()};
    return randomEngine;
}

}
