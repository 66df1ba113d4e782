#include "main/DatabaseUsedSetBackend.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string_view>

using testing::ElementsAre;
using testing::IsEmpty;

using Tarot::Main::DatabaseUsedSetBackend;

using namespace std::string_view_literals;

namespace {

constexpr auto SESSION = "session"sv;

struct DataDirectory {
    DataDirectory() :
        path {std::filesystem::temp_directory_path() / "tarot-testdb"}
    {
        std::filesystem::remove_all(path);
    }

    ~DataDirectory()
    {
        std::filesystem::remove_all(path);
    }

    std::filesystem::path path;
};

}

class DatabaseUsedSetBackendTest : public testing::Test {
protected:
    DataDirectory dataDirectory;
    std::unique_ptr<DatabaseUsedSetBackend> backend {
        std::make_unique<DatabaseUsedSetBackend>(dataDirectory.path.string())};
};

TEST_F(DatabaseUsedSetBackendTest, testUnknownSessionIsEmpty)
{
    EXPECT_THAT(backend->getUsed(SESSION), IsEmpty());
}

TEST_F(DatabaseUsedSetBackendTest, testAddUsed)
{
    backend->addUsed(SESSION, 21);
    backend->addUsed(SESSION, 0);
    backend->addUsed(SESSION, 21);
    EXPECT_THAT(backend->getUsed(SESSION), ElementsAre(0, 21));
}

TEST_F(DatabaseUsedSetBackendTest, testSessionPrefixingAnotherSession)
{
    backend->addUsed("s"sv, 1);
    backend->addUsed("s1"sv, 2);
    backend->addUsed(""sv, 3);
    EXPECT_THAT(backend->getUsed("s"sv), ElementsAre(1));
    EXPECT_THAT(backend->getUsed("s1"sv), ElementsAre(2));
    EXPECT_THAT(backend->getUsed(""sv), ElementsAre(3));
}

TEST_F(DatabaseUsedSetBackendTest, testClearUsed)
{
    backend->addUsed(SESSION, 1);
    backend->addUsed(SESSION, 2);
    backend->addUsed("other"sv, 3);
    backend->clearUsed(SESSION);
    EXPECT_THAT(backend->getUsed(SESSION), IsEmpty());
    EXPECT_THAT(backend->getUsed("other"sv), ElementsAre(3));
}

TEST_F(DatabaseUsedSetBackendTest, testClearUnknownSession)
{
    backend->clearUsed(SESSION);
    EXPECT_THAT(backend->getUsed(SESSION), IsEmpty());
}

TEST_F(DatabaseUsedSetBackendTest, testUsedSetsArePersisted)
{
    backend->addUsed(SESSION, 4);
    backend->addUsed(SESSION, 7);
    backend.reset();
    backend = std::make_unique<DatabaseUsedSetBackend>(
        dataDirectory.path.string());
    EXPECT_THAT(backend->getUsed(SESSION), ElementsAre(4, 7));
}
