#include "engine/UsedSetBackend.hh"

namespace Tarot {
namespace Engine {

UsedSetBackend::~UsedSetBackend() = default;

UsedSetBackend::IndexSet UsedSetBackend::getUsed(
    const std::string_view session) const
{
    return handleGetUsed(session);
}

void UsedSetBackend::addUsed(const std::string_view session, const int index)
{
    handleAddUsed(session, index);
}

void UsedSetBackend::clearUsed(const std::string_view session)
{
    handleClearUsed(session);
}

}
}
