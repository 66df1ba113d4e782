#include "main/Commands.hh"

namespace Tarot {
namespace Main {

const std::string DRAW_COMMAND {"draw"};
const std::string SPREAD_COMMAND {"spread"};
const std::string RESET_COMMAND {"reset"};
const std::string HEALTH_COMMAND {"health"};
const std::string SESSION_COMMAND {"session"};
const std::string COUNT_COMMAND {"count"};
const std::string RESET_IF_EXHAUSTED_COMMAND {"resetIfExhausted"};
const std::string CARDS_COMMAND {"cards"};
const std::string STATUS_COMMAND {"status"};
const std::string TIME_COMMAND {"time"};
const std::string DECK_SIZE_COMMAND {"deckSize"};
const std::string NO_DECK_FAILURE {"NODECK"};
const std::string EXHAUSTED_FAILURE {"EXHAUSTED"};
const std::string BACKEND_FAILURE {"BACKEND"};

}
}
