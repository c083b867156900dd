#include "config.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support
#include <spdlog/spdlog.h>

namespace {

E<std::string> readFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        return std::unexpected(makeError(
            ErrorCode::INVALID_REQUEST,
            std::format("Cannot open config file: {}", path)));
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void overrideFromEnv(const char* name, std::string& value)
{
    const char* v = std::getenv(name);
    if(v != nullptr && *v != '\0')
    {
        value = v;
    }
}

} // namespace

Config& Config::get()
{
    static Config instance;
    return instance;
}

E<void> Config::load(const std::string& path)
{
    ASSIGN_OR_RETURN(std::string content, readFile(path));
    // parse_in_arena copies the buffer into the tree, and values are
    // copied out right away.
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::NodeRef root = tree.rootref();

    if(root.has_child("listen_address"))
        root["listen_address"] >> listen_address;
    if(root.has_child("port")) root["port"] >> port;
    if(root.has_child("clock_skew_seconds"))
        root["clock_skew_seconds"] >> clock_skew_seconds;
    if(root.has_child("log_level")) root["log_level"] >> log_level;

    if(root.has_child("storage"))
    {
        auto node = root["storage"];
        if(node.has_child("backend")) node["backend"] >> storage.backend;
        if(node.has_child("root_dir")) node["root_dir"] >> storage.root_dir;
        if(node.has_child("db_path")) node["db_path"] >> storage.db_path;
    }

    // spdlog maps any name it does not know to “off”.
    if(spdlog::level::from_str(log_level) == spdlog::level::off &&
       log_level != "off")
    {
        return std::unexpected(makeError(
            ErrorCode::INVALID_REQUEST,
            std::format("Unknown log_level: {}", log_level)));
    }
    if(clock_skew_seconds < 0)
    {
        return std::unexpected(makeError(
            ErrorCode::INVALID_REQUEST,
            "clock_skew_seconds must not be negative"));
    }
    return {};
}

void Config::applyEnv()
{
    overrideFromEnv("WAS_STORAGE_BACKEND", storage.backend);
    overrideFromEnv("WAS_STORAGE_ROOT_DIR", storage.root_dir);
    overrideFromEnv("WAS_STORAGE_DB_PATH", storage.db_path);
}
