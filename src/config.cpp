#include "config.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support

namespace
{

[[noreturn]] void throwYamlError(const char* msg, size_t msg_len,
                                 ryml::Location, void*)
{
    throw std::runtime_error(std::string(msg, msg_len));
}

Account loadAccount(ryml::NodeRef node, size_t index)
{
    if(!node.is_map())
    {
        throw std::runtime_error(std::format(
            "Account #{} is not a mapping", index + 1));
    }
    Account account;
    if(node.has_child("id")) node["id"] >> account.id;
    if(account.id.empty())
    {
        account.id = newLocalID();
    }

    std::string network;
    if(node.has_child("network")) node["network"] >> network;
    auto parsed = networkFromStr(network);
    if(!parsed.has_value())
    {
        throw std::runtime_error(std::format(
            "Account #{} has unknown network: {}", index + 1, network));
    }
    account.network = *parsed;

    if(node.has_child("handle")) node["handle"] >> account.handle;
    if(account.handle.empty())
    {
        throw std::runtime_error(std::format(
            "Account #{} has no handle", index + 1));
    }
    if(node.has_child("server")) node["server"] >> account.server;
    if(account.server.empty() && account.network == Network::BLUESKY)
    {
        account.server = DEFAULT_BLUESKY_SERVER;
    }
    if(node.has_child("display_name"))
    {
        node["display_name"] >> account.display_name;
    }
    if(account.display_name.empty())
    {
        account.display_name = account.handle;
    }
    if(node.has_child("default")) node["default"] >> account.is_default;
    account.time_creation = mw::Clock::now();
    return account;
}

} // namespace

std::string readFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

ryml::Tree parseYaml(const std::string& content)
{
    ryml::Callbacks previous = ryml::get_callbacks();
    ryml::set_callbacks(ryml::Callbacks(nullptr, nullptr, nullptr,
                                        throwYamlError));
    try
    {
        ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
        ryml::set_callbacks(previous);
        return tree;
    }
    catch(const std::runtime_error&)
    {
        ryml::set_callbacks(previous);
        throw;
    }
}

Config& Config::get()
{
    static Config instance;
    return instance;
}

void Config::load(const std::string& path)
{
    std::string content = readFile(path);
    ryml::Tree tree = parseYaml(content);
    ryml::NodeRef root = tree.rootref();

    *this = Config();
    if(!root.is_map())
    {
        if(root.has_val() || root.is_seq())
        {
            throw std::runtime_error("Config is not a mapping: " + path);
        }
        // Empty file.
        return;
    }

    if(root.has_child("log_level")) root["log_level"] >> log_level;
    if(root.has_child("post_limit")) root["post_limit"] >> post_limit;
    if(root.has_child("queue_capacity"))
    {
        root["queue_capacity"] >> queue_capacity;
    }
    if(root.has_child("secrets_path")) root["secrets_path"] >> secrets_path;
    if(root.has_child("schedule_path")) root["schedule_path"] >> schedule_path;
    if(post_limit <= 0 || queue_capacity <= 0)
    {
        throw std::runtime_error(
            "post_limit and queue_capacity must be positive");
    }

    if(root.has_child("accounts"))
    {
        ryml::NodeRef list = root["accounts"];
        if(!list.is_seq())
        {
            throw std::runtime_error("accounts must be a list");
        }
        size_t i = 0;
        for(ryml::NodeRef node : list.children())
        {
            accounts.push_back(loadAccount(node, i));
            i++;
        }
    }
}
