#include "engine/MemoryUsedSetBackend.hh"

namespace Tarot {
namespace Engine {

UsedSetBackend::IndexSet MemoryUsedSetBackend::handleGetUsed(
    const std::string_view session) const
{
    const auto lock = std::lock_guard {mutex};
    const auto iter = usedSets.find(session);
    return iter != usedSets.end() ? iter->second : IndexSet {};
}

void MemoryUsedSetBackend::handleAddUsed(
    const std::string_view session, const int index)
{
    const auto lock = std::lock_guard {mutex};
    auto iter = usedSets.find(session);
    if (iter == usedSets.end()) {
        iter = usedSets.emplace(std::string {session}, IndexSet {}).first;
    }
    iter->second.insert(index);
}

void MemoryUsedSetBackend::handleClearUsed(const std::string_view session)
{
    const auto lock = std::lock_guard {mutex};
    const auto iter = usedSets.find(session);
    if (iter != usedSets.end()) {
        usedSets.erase(iter);
    }
}

}
}
