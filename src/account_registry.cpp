#include "account_registry.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

namespace
{

Error noSuchAccount(const std::string& id)
{
    return preconditionError(std::format("No account with ID {}", id));
}

} // namespace

AccountRegistry::AccountRegistry(std::vector<Account> accounts)
        : all(std::move(accounts))
{
    bool seen_default = false;
    for(Account& a : all)
    {
        if(a.is_default && seen_default)
        {
            spdlog::warn("More than one default account, ignoring {}",
                         a.fullHandle());
            a.is_default = false;
        }
        seen_default = seen_default || a.is_default;
    }
}

std::vector<Account> AccountRegistry::accountsOn(Network network) const
{
    std::vector<Account> result;
    std::copy_if(all.begin(), all.end(), std::back_inserter(result),
                 [network](const Account& a) { return a.network == network; });
    return result;
}

std::optional<Account> AccountRegistry::find(const std::string& id) const
{
    auto it = std::find_if(all.begin(), all.end(),
                           [&id](const Account& a) { return a.id == id; });
    if(it == all.end())
    {
        return std::nullopt;
    }
    return *it;
}

std::optional<Account> AccountRegistry::defaultAccount() const
{
    auto it = std::find_if(all.begin(), all.end(),
                           [](const Account& a) { return a.is_default; });
    if(it == all.end())
    {
        return std::nullopt;
    }
    return *it;
}

E<void> AccountRegistry::add(Account account)
{
    if(findMut(account.id) != nullptr)
    {
        return std::unexpected(preconditionError(std::format(
            "Account with ID {} already exists", account.id)));
    }
    const bool make_default = account.is_default;
    std::string id = account.id;
    all.push_back(std::move(account));
    if(make_default)
    {
        return setDefault(id);
    }
    return {};
}

E<void> AccountRegistry::remove(const std::string& id)
{
    auto it = std::find_if(all.begin(), all.end(),
                           [&id](const Account& a) { return a.id == id; });
    if(it == all.end())
    {
        return std::unexpected(noSuchAccount(id));
    }
    all.erase(it);
    return {};
}

E<void> AccountRegistry::setDefault(const std::string& id)
{
    if(findMut(id) == nullptr)
    {
        return std::unexpected(noSuchAccount(id));
    }
    for(Account& a : all)
    {
        a.is_default = (a.id == id);
    }
    return {};
}

E<void> AccountRegistry::touch(const std::string& id)
{
    Account* a = findMut(id);
    if(a == nullptr)
    {
        return std::unexpected(noSuchAccount(id));
    }
    a->time_last_used = mw::Clock::now();
    return {};
}

Account* AccountRegistry::findMut(const std::string& id)
{
    for(Account& a : all)
    {
        if(a.id == id)
        {
            return &a;
        }
    }
    return nullptr;
}
