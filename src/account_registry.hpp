#pragma once

#include <optional>
#include <string>
#include <vector>

#include "data_types.hpp"
#include "error.hpp"

// The accounts the user has configured. At most one account is the
// default, counting all networks together.
class AccountRegistry
{
public:
    AccountRegistry() = default;
    // If more than one account claims to be the default, the first
    // one wins.
    explicit AccountRegistry(std::vector<Account> accounts);

    const std::vector<Account>& accounts() const { return all; }
    std::vector<Account> accountsOn(Network network) const;
    std::optional<Account> find(const std::string& id) const;
    std::optional<Account> defaultAccount() const;

    // Fails if an account with the same ID exists.
    E<void> add(Account account);
    E<void> remove(const std::string& id);
    // Clears the default flag on every other account, including those
    // on the other network.
    E<void> setDefault(const std::string& id);
    // Record that the account was just used.
    E<void> touch(const std::string& id);

private:
    Account* findMut(const std::string& id);

    std::vector<Account> all;
};
