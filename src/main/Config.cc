#include "main/Config.hh"

#include "IoUtility.hh"
#include "Logging.hh"

#include <cassert>
#include <iterator>
#include <istream>
#include <new>
#include <stdexcept>

#include <boost/format.hpp>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Tarot {
namespace Main {

using namespace std::string_literals;

namespace {

const auto BIND_ADDRESS = "bind_address"s;
const auto BIND_PORT = "bind_port"s;
const auto DECK_PATHS = "deck_paths"s;
const auto DATA_DIR = "data_dir"s;

const auto DEFAULT_BIND_ADDRESS = "*"s;
constexpr auto DEFAULT_BIND_PORT = 5555;
const auto DEFAULT_DECK_PATHS = std::vector {
    "data/tarot.csv"s,
    "data/tarot_sample.csv"s,
};

constexpr auto MAX_PORT = 65535;

// Owns a Lua interpreter with the standard libraries opened
class LuaState {
public:
    LuaState();
    ~LuaState();
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;

    void run(const std::string& chunk);

    std::optional<std::string> getString(const std::string& name);
    std::optional<lua_Integer> getInt(const std::string& name);
    std::optional<std::vector<std::string>> getStringArray(
        const std::string& name);

private:

    // Pops the value pushed on construction when leaving the scope
    class Top {
    public:
        Top(lua_State* lua) : lua {lua} {}
        ~Top() { lua_pop(lua, 1); }
        Top(const Top&) = delete;
        Top& operator=(const Top&) = delete;
    private:
        lua_State* lua;
    };

    bool isUnset() const;

    lua_State* lua;
};

LuaState::LuaState() :
    lua {luaL_newstate()}
{
    if (!lua) {
        throw std::bad_alloc {};
    }
    luaL_openlibs(lua);
}

LuaState::~LuaState()
{
    lua_close(lua);
}

void LuaState::run(const std::string& chunk)
{
    const auto error =
        luaL_loadbufferx(lua, chunk.data(), chunk.size(), "config", "t") ||
        lua_pcall(lua, 0, 0, 0);
    if (error) {
        // Error objects need not be strings
        const auto message = std::string {luaL_tolstring(lua, -1, nullptr)};
        lua_pop(lua, 2);
        log(LogLevel::ERROR, "Error while running config script: %s",
            message);
        throw std::runtime_error {"Could not process config: " + message};
    }
}

bool LuaState::isUnset() const
{
    return lua_isnoneornil(lua, -1);
}

std::optional<std::string> LuaState::getString(const std::string& name)
{
    lua_getglobal(lua, name.c_str());
    const auto top = Top {lua};
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return std::string {lua_tostring(lua, -1)};
    }
    if (!isUnset()) {
        log(LogLevel::WARNING, "Config: %s is not a string, ignored", name);
    }
    return std::nullopt;
}

std::optional<lua_Integer> LuaState::getInt(const std::string& name)
{
    lua_getglobal(lua, name.c_str());
    const auto top = Top {lua};
    auto is_integer = 0;
    const auto value = lua_tointegerx(lua, -1, &is_integer);
    if (is_integer) {
        return value;
    }
    if (!isUnset()) {
        log(LogLevel::WARNING, "Config: %s is not an integer, ignored", name);
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> LuaState::getStringArray(
    const std::string& name)
{
    lua_getglobal(lua, name.c_str());
    const auto top = Top {lua};
    if (!lua_istable(lua, -1)) {
        if (!isUnset()) {
            log(LogLevel::WARNING,
                "Config: %s is not an array of strings, ignored", name);
        }
        return std::nullopt;
    }
    auto ret = std::vector<std::string> {};
    const auto size = static_cast<lua_Integer>(lua_rawlen(lua, -1));
    for (auto n = lua_Integer {1}; n <= size; ++n) {
        lua_rawgeti(lua, -1, n);
        const auto element = Top {lua};
        if (lua_type(lua, -1) != LUA_TSTRING) {
            log(LogLevel::WARNING,
                "Config: element %d of %s is not a string, %s ignored",
                n, name, name);
            return std::nullopt;
        }
        ret.emplace_back(lua_tostring(lua, -1));
    }
    return ret;
}

std::string readAll(std::istream& in)
{
    if (!in) {
        throw std::runtime_error {"Failed to read config: bad stream"};
    }
    auto ret = std::string(
        std::istreambuf_iterator<char> {in}, std::istreambuf_iterator<char> {});
    if (in.bad()) {
        throw std::runtime_error {"Failed to read config"};
    }
    return ret;
}

}

class Config::Impl {
public:

    Impl() = default;
    Impl(std::istream& in);

    std::string bindAddress {DEFAULT_BIND_ADDRESS};
    int bindPort {DEFAULT_BIND_PORT};
    std::vector<std::string> deckPaths {DEFAULT_DECK_PATHS};
    std::optional<std::string> dataDir {};
};

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    auto lua = LuaState {};
    lua.run(readAll(in));

    if (auto address = lua.getString(BIND_ADDRESS)) {
        bindAddress = std::move(*address);
    }
    if (const auto port = lua.getInt(BIND_PORT)) {
        if (0 < *port && *port <= MAX_PORT) {
            bindPort = static_cast<int>(*port);
        } else {
            log(LogLevel::WARNING, "Config: invalid port %d, using %d",
                *port, DEFAULT_BIND_PORT);
        }
    }
    if (auto paths = lua.getStringArray(DECK_PATHS)) {
        deckPaths = std::move(*paths);
    }
    dataDir = lua.getString(DATA_DIR);

    log(LogLevel::INFO, "Reading configs completed");
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

std::string Config::getEndpoint() const
{
    assert(impl);
    return (
        boost::format("tcp://%1%:%2%") % impl->bindAddress % impl->bindPort)
        .str();
}

const std::vector<std::string>& Config::getDeckPaths() const
{
    assert(impl);
    return impl->deckPaths;
}

std::optional<std::string_view> Config::getDataDir() const
{
    assert(impl);
    return impl->dataDir;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    }
    log(LogLevel::DEBUG, "Config file: %s", path);
    return processStreamFromPath(path, [](auto& in) { return Config {in}; });
}

}
}
