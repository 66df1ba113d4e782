#include "messaging/Sockets.hh"
#include "main/Config.hh"
#include "main/TarotMain.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace {

using namespace Tarot;
using Main::TarotMain;

class TarotApp {
public:

    TarotApp(
        Messaging::MessageContext& zmqctx,
        const std::string& configPath) :
        app {zmqctx, Main::configFromPath(configPath)}
    {
        log(Tarot::LogLevel::INFO, "Startup completed");
    }

    ~TarotApp()
    {
        log(Tarot::LogLevel::INFO, "Shutting down");
    }

    void run()
    {
        app.run();
    }

private:

    TarotMain app;
};

std::string parseArgs(int argc, char* argv[])
{
    auto configPath = std::string {};

    const auto short_opt = "vf:";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            configPath = optarg;
        } else {
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(Tarot::getLogLevel(verbosity), std::cerr);

    return configPath;
}

}

int tarot_main(int argc, char* argv[])
{
    const auto configPath = parseArgs(argc, argv);
    Messaging::MessageContext zmqctx;
    TarotApp app {zmqctx, configPath};
    app.run();
    return EXIT_SUCCESS;
}
