/** \file
 *
 * \brief Definition of Tarot::Engine::MemoryUsedSetBackend class
 */

#ifndef ENGINE_MEMORYUSEDSETBACKEND_HH_
#define ENGINE_MEMORYUSEDSETBACKEND_HH_

#include "engine/UsedSetBackend.hh"

#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace Tarot {
namespace Engine {

/** \brief Used set backend keeping the sets in memory
 *
 * The sets live as long as the backend object. Every operation locks a
 * single mutex, so the backend may be shared between threads.
 */
class MemoryUsedSetBackend : public UsedSetBackend {
private:

    IndexSet handleGetUsed(std::string_view session) const override;
    void handleAddUsed(std::string_view session, int index) override;
    void handleClearUsed(std::string_view session) override;

    mutable std::mutex mutex;
    std::map<std::string, IndexSet, std::less<>> usedSets;
};

}
}

#endif // ENGINE_MEMORYUSEDSETBACKEND_HH_
