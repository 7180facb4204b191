#include "error.hpp"

#include <format>
#include <string>
#include <variant>

#include <mw/error.hpp>

std::string errorMsg(const Error& e)
{
    return std::visit([](const auto& err) { return err.msg; }, e);
}

Error withContext(Error e, std::string_view context)
{
    std::visit([&](auto& err)
    {
        err.msg = std::format("{}: {}", context, err.msg);
    }, e);
    return e;
}

Error fromHTTPError(const mw::Error& e)
{
    return transportError(mw::errorMsg(e));
}

bool isRetryable(const Error& e)
{
    if(std::holds_alternative<TransportError>(e))
    {
        return true;
    }
    if(const auto* p = std::get_if<ProtocolError>(&e))
    {
        return p->status == 429 || p->status >= 500;
    }
    return false;
}
