#include "main/DatabaseUsedSetBackend.hh"

#include "Logging.hh"

#include <boost/endian/conversion.hpp>

#include <rocksdb/db.h>
#include <rocksdb/write_batch.h>

#include <array>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace Tarot {
namespace Main {

namespace {

const auto COLUMN_FAMILY_NAMES = std::array {
    // Default column family missing here
    std::string {"used_v1"},
};

const auto DB_ERROR_MSG = std::string {"Failed to open database: "};

// Key layout: big endian session length, session, big endian index. The
// length prefix keeps a session from being a key prefix of another session.

void appendBigEndian(std::string& key, const std::uint32_t value)
{
    const auto packed = boost::endian::native_to_big(value);
    key.append(reinterpret_cast<const char*>(&packed), sizeof(packed));
}

std::string sessionPrefix(const std::string_view session)
{
    auto ret = std::string {};
    ret.reserve(sizeof(std::uint32_t) * 2 + session.size());
    appendBigEndian(ret, static_cast<std::uint32_t>(session.size()));
    ret.append(session);
    return ret;
}

std::string usedKey(const std::string_view session, const int index)
{
    auto ret = sessionPrefix(session);
    appendBigEndian(ret, static_cast<std::uint32_t>(index));
    return ret;
}

int indexFromKey(const rocksdb::Slice& key, const std::size_t prefixSize)
{
    if (key.size() != prefixSize + sizeof(std::uint32_t)) {
        throw Engine::BackendFailure {"Malformed key in used set database"};
    }
    auto packed = std::uint32_t {};
    std::memcpy(&packed, key.data() + prefixSize, sizeof(packed));
    return static_cast<int>(boost::endian::big_to_native(packed));
}

void checkStatus(const rocksdb::Status& status, const char* operation)
{
    if (!status.ok()) {
        log(LogLevel::WARNING, "Failed database %s operation: %s",
            operation, status.ToString());
        throw Engine::BackendFailure {status.ToString()};
    }
}

}

class DatabaseUsedSetBackend::Impl {
public:
    Impl(const std::string& path);
    ~Impl();

    IndexSet getUsed(std::string_view session) const;
    void addUsed(std::string_view session, int index);
    void clearUsed(std::string_view session);

private:

    rocksdb::ColumnFamilyHandle* getUsedColumnFamilyHandle() const;

    std::unique_ptr<rocksdb::DB> db;
    std::vector<rocksdb::ColumnFamilyHandle*> columnFamilyHandles;
};

DatabaseUsedSetBackend::Impl::Impl(const std::string& path)
{
    auto db = static_cast<rocksdb::DB*>(nullptr);
    auto options = rocksdb::Options {};
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    auto column_families = std::vector<rocksdb::ColumnFamilyDescriptor> {};
    column_families.emplace_back(); // this is the default column family
    for (const auto& name : COLUMN_FAMILY_NAMES) {
        column_families.emplace_back(name, options);
    }
    const auto status = rocksdb::DB::Open(
        options, path, column_families, &columnFamilyHandles, &db);
    if (!status.ok()) {
        throw std::runtime_error {DB_ERROR_MSG + status.ToString()};
    }
    this->db.reset(db);
    log(LogLevel::INFO, "Opened used set database at %s", path);
}

DatabaseUsedSetBackend::Impl::~Impl()
{
    assert(db);
    for (auto handle : columnFamilyHandles) {
        const auto status = db->DestroyColumnFamilyHandle(handle);
        assert(status.ok());
    }
}

rocksdb::ColumnFamilyHandle*
DatabaseUsedSetBackend::Impl::getUsedColumnFamilyHandle() const
{
    assert(columnFamilyHandles.size() == COLUMN_FAMILY_NAMES.size() + 1);
    return columnFamilyHandles[1];
}

Engine::UsedSetBackend::IndexSet DatabaseUsedSetBackend::Impl::getUsed(
    const std::string_view session) const
{
    assert(db);
    const auto prefix = sessionPrefix(session);
    const auto prefix_slice = rocksdb::Slice {prefix};
    auto ret = IndexSet {};
    const auto iter = std::unique_ptr<rocksdb::Iterator> {
        db->NewIterator(rocksdb::ReadOptions {}, getUsedColumnFamilyHandle())};
    for (iter->Seek(prefix_slice);
         iter->Valid() && iter->key().starts_with(prefix_slice);
         iter->Next()) {
        ret.insert(indexFromKey(iter->key(), prefix.size()));
    }
    checkStatus(iter->status(), "iterate");
    return ret;
}

void DatabaseUsedSetBackend::Impl::addUsed(
    const std::string_view session, const int index)
{
    assert(db);
    const auto key = usedKey(session, index);
    const auto status = db->Put(
        rocksdb::WriteOptions {}, getUsedColumnFamilyHandle(), key,
        rocksdb::Slice {});
    checkStatus(status, "put");
}

void DatabaseUsedSetBackend::Impl::clearUsed(const std::string_view session)
{
    assert(db);
    const auto handle = getUsedColumnFamilyHandle();
    const auto prefix = sessionPrefix(session);
    const auto prefix_slice = rocksdb::Slice {prefix};
    auto batch = rocksdb::WriteBatch {};
    {
        const auto iter = std::unique_ptr<rocksdb::Iterator> {
            db->NewIterator(rocksdb::ReadOptions {}, handle)};
        for (iter->Seek(prefix_slice);
             iter->Valid() && iter->key().starts_with(prefix_slice);
             iter->Next()) {
            checkStatus(batch.Delete(handle, iter->key()), "delete");
        }
        checkStatus(iter->status(), "iterate");
    }
    checkStatus(db->Write(rocksdb::WriteOptions {}, &batch), "write");
}

DatabaseUsedSetBackend::DatabaseUsedSetBackend(const std::string& path) :
    impl {std::make_unique<Impl>(path)}
{
}

DatabaseUsedSetBackend::~DatabaseUsedSetBackend() = default;

Engine::UsedSetBackend::IndexSet DatabaseUsedSetBackend::handleGetUsed(
    const std::string_view session) const
{
    assert(impl);
    return impl->getUsed(session);
}

void DatabaseUsedSetBackend::handleAddUsed(
    const std::string_view session, const int index)
{
    assert(impl);
    impl->addUsed(session, index);
}

void DatabaseUsedSetBackend::handleClearUsed(const std::string_view session)
{
    assert(impl);
    impl->clearUsed(session);
}

}
}
