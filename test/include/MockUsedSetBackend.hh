#ifndef MOCKUSEDSETBACKEND_HH_
#define MOCKUSEDSETBACKEND_HH_

#include "engine/UsedSetBackend.hh"

#include <gmock/gmock.h>

namespace Tarot {
namespace Engine {

class MockUsedSetBackend : public UsedSetBackend {
public:
    MOCK_CONST_METHOD1(handleGetUsed, IndexSet(std::string_view));
    MOCK_METHOD2(handleAddUsed, void(std::string_view, int));
    MOCK_METHOD1(handleClearUsed, void(std::string_view));
};

}
}

#endif // MOCKUSEDSETBACKEND_HH_
