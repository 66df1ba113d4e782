/** \file
 *
 * \brief Definition of Tarot::Main::DatabaseUsedSetBackend class
 */

#ifndef MAIN_DATABASEUSEDSETBACKEND_HH_
#define MAIN_DATABASEUSEDSETBACKEND_HH_

#include "engine/UsedSetBackend.hh"

#include <memory>
#include <string>

namespace Tarot {
namespace Main {

/** \brief Used set backend storing the sets in a RocksDB database
 *
 * Each used index is stored as its own key in the \c used_v1 column family,
 * so that adding an index is a single write and clearing a session is a
 * single write batch. The sets survive restarts of the server.
 *
 * The database can only be opened by one process at a time.
 */
class DatabaseUsedSetBackend : public Engine::UsedSetBackend {
public:

    /** \brief Create database backend
     *
     * The database is created if it doesn’t exist.
     *
     * \param path path to the database directory
     *
     * \throw std::runtime_error if the database cannot be opened
     */
    explicit DatabaseUsedSetBackend(const std::string& path);

    ~DatabaseUsedSetBackend();

private:

    IndexSet handleGetUsed(std::string_view session) const override;
    void handleAddUsed(std::string_view session, int index) override;
    void handleClearUsed(std::string_view session) override;

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MAIN_DATABASEUSEDSETBACKEND_HH_
