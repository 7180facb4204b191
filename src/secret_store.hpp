#pragma once

#include <optional>
#include <string>
#include <utility>

#include "data_types.hpp"
#include "error.hpp"

class SecretStoreInterface
{
public:
    virtual ~SecretStoreInterface() = default;

    // The secret of an account, or nothing if none is stored. Failing
    // to read the store is an error.
    virtual E<std::optional<std::string>>
    getCredentials(const Account& account) = 0;
};

// Secrets in a YAML file, as a mapping from Account::credentialKey()
// to secret. The file is read again on every lookup, so edits take
// effect without a restart.
class FileSecretStore : public SecretStoreInterface
{
public:
    explicit FileSecretStore(std::string path) : path(std::move(path)) {}

    E<std::optional<std::string>>
    getCredentials(const Account& account) override;

private:
    std::string path;
};
