/** \file
 *
 * \brief Definition of Tarot::Main::TarotMain class
 */

#ifndef MAIN_TAROTMAIN_HH_
#define MAIN_TAROTMAIN_HH_

#include <zmq.hpp>

#include <memory>

namespace Tarot {

/** \brief The glue code and high level logic for the tarot server
 *
 * The main class TarotMain is responsible for setting up the tarot server
 * application.
 */
namespace Main {

class Config;

/** \brief Set up and run the tarot server
 *
 * When constructed, TarotMain loads the deck, sets up the used set backend
 * and the draw engine, and binds the control socket clients connect to.
 *
 * The server starts processing messages when run() is called. The destructor
 * closes sockets and cleans up the application.
 *
 * \sa \ref tarotprotocol
 */
class TarotMain {
public:

    /** \brief Create tarot server
     *
     * \param context the ZeroMQ context for the server
     * \param config the application configurations
     */
    TarotMain(zmq::context_t& context, Config config);

    ~TarotMain();

    /** \brief Start receiving and handling messages
     *
     * This method blocks until SIGINT or SIGTERM is received.
     */
    void run();

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MAIN_TAROTMAIN_HH_
