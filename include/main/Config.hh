/** \file
 *
 * \brief Definition of Tarot::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Tarot {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration file is a Lua script. After running the script, the
 * following global variables are read:
 *
 * - \c bind_address: the interface the control socket is bound to (string,
 *   default “*”)
 * - \c bind_port: the port the control socket is bound to (integer between 1
 *   and 65535, default 5555)
 * - \c deck_paths: the candidate deck files tried in order (array of
 *   strings, default <tt>{ "data/tarot.csv", "data/tarot_sample.csv" }</tt>)
 * - \c data_dir: the directory of the used set database (string). If
 *   missing, the used sets are kept in memory.
 *
 * A variable with an unexpected type is ignored with a warning.
 */
class Config {
public:

    /** \brief Create default configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the script
     * fails
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the endpoint of the control socket
     *
     * \return the endpoint in “tcp://address:port” format
     */
    std::string getEndpoint() const;

    /** \brief Get the candidate deck files
     *
     * \return the paths in the order they are tried
     */
    const std::vector<std::string>& getDeckPaths() const;

    /** \brief Get data directory
     *
     * \return Path to the data directory, or nullopt if there is no data
     * directory
     */
    std::optional<std::string_view> getDataDir() const;

private:

    class Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, default configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
