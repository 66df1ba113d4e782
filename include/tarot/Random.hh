/** \file
 *
 * \brief The common random number generator
 */

#ifndef TAROT_RANDOM_HH_
#define TAROT_RANDOM_HH_

#include <random>

namespace Tarot {

/** \brief The preferred random number generator for the Tarot project
 */
using Rng = std::mt19937;

/** \brief Get reference to the random number generator of the calling thread
 *
 * Each thread has its own generator seeded from the OS random number source,
 * so the reference must not be shared with other threads.
 *
 * \return Reference to the random number generator
 */
Rng& getRng();

}

#endif // TAROT_RANDOM_HH_
