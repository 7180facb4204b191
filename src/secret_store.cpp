#include "secret_store.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

#include <ryml.hpp>
#include <ryml_std.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"

E<std::optional<std::string>>
FileSecretStore::getCredentials(const Account& account)
{
    std::error_code ec;
    if(!std::filesystem::exists(path, ec))
    {
        spdlog::debug("Secrets file {} does not exist", path);
        return std::nullopt;
    }

    ryml::Tree tree;
    std::string content;
    try
    {
        content = readFile(path);
        tree = parseYaml(content);
    }
    catch(const std::runtime_error& e)
    {
        return std::unexpected(credentialError(std::format(
            "Failed to read secrets from {}: {}", path, e.what())));
    }

    ryml::NodeRef root = tree.rootref();
    if(!root.is_map())
    {
        if(root.has_val() || root.is_seq())
        {
            return std::unexpected(credentialError(std::format(
                "Secrets file {} is not a mapping", path)));
        }
        return std::nullopt;
    }

    const std::string key = account.credentialKey();
    if(!root.has_child(ryml::to_csubstr(key)))
    {
        return std::nullopt;
    }
    ryml::NodeRef node = root[ryml::to_csubstr(key)];
    if(!node.has_val())
    {
        return std::unexpected(credentialError(std::format(
            "Secret for {} is not a string", key)));
    }
    std::string secret;
    node >> secret;
    if(secret.empty())
    {
        return std::nullopt;
    }
    return secret;
}
