#include "messaging/Identity.hh"

#include <gtest/gtest.h>

#include <sstream>

using Tarot::Messaging::Identity;

namespace {
using namespace Tarot::BlobLiterals;
}

TEST(IdentityTest, testOutputIsHex)
{
    auto os = std::ostringstream {};
    os << Identity {"\x01\xab"_B};
    EXPECT_EQ("01ab", os.str());
}

TEST(IdentityTest, testIdentityFromNullMessageIsEmpty)
{
    EXPECT_EQ(Identity {}, Tarot::Messaging::identityFromMessage(nullptr));
}

TEST(IdentityTest, testIdentityFromMessage)
{
    const auto message = Tarot::Messaging::Message {"abc", 3};
    EXPECT_EQ(
        Identity {"abc"_B},
        Tarot::Messaging::identityFromMessage(&message));
}

TEST(IdentityTest, testComparison)
{
    EXPECT_LT(Identity {"a"_B}, Identity {"b"_B});
    EXPECT_NE(Identity {"a"_B}, Identity {"b"_B});
}
