/** \file
 *
 * \brief Definition of Tarot::Engine::UsedSetBackend interface
 */

#ifndef ENGINE_USEDSETBACKEND_HH_
#define ENGINE_USEDSETBACKEND_HH_

#include <set>
#include <stdexcept>
#include <string_view>

namespace Tarot {
namespace Engine {

/** \brief Exception indicating that the used set storage failed
 */
class BackendFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** \brief Storage for the cards each session has already drawn
 *
 * UsedSetBackend is the abstract interface DrawEngine uses to record the
 * indices of the cards returned to a session. A session is an opaque string
 * chosen by the client. The backend holds no state for a session before the
 * first index is added to it.
 *
 * Each operation is atomic with respect to other operations of the same
 * backend. Sequences of operations are not.
 *
 * All operations report storage failures by throwing BackendFailure.
 */
class UsedSetBackend {
public:

    /** \brief Set of card indices
     */
    using IndexSet = std::set<int>;

    virtual ~UsedSetBackend();

    /** \brief Retrieve the used set of a session
     *
     * \param session the session
     *
     * \return the indices recorded for \p session, or an empty set if the
     * session is unknown
     *
     * \throw BackendFailure if the storage fails
     */
    IndexSet getUsed(std::string_view session) const;

    /** \brief Record an index as used
     *
     * Adding an index already in the set has no effect.
     *
     * \param session the session
     * \param index the card index
     *
     * \throw BackendFailure if the storage fails
     */
    void addUsed(std::string_view session, int index);

    /** \brief Clear the used set of a session
     *
     * Clearing an empty or unknown session has no effect.
     *
     * \param session the session
     *
     * \throw BackendFailure if the storage fails
     */
    void clearUsed(std::string_view session);

private:

    /** \brief Handle for retrieving the used set
     *
     * \sa getUsed()
     */
    virtual IndexSet handleGetUsed(std::string_view session) const = 0;

    /** \brief Handle for recording an index
     *
     * \sa addUsed()
     */
    virtual void handleAddUsed(std::string_view session, int index) = 0;

    /** \brief Handle for clearing the used set
     *
     * \sa clearUsed()
     */
    virtual void handleClearUsed(std::string_view session) = 0;
};

}
}

#endif // ENGINE_USEDSETBACKEND_HH_
