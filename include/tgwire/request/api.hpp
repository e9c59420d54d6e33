#pragma once

#include <string>

#include "tgwire/core/config.hpp"
#include "tgwire/core/error.hpp"
#include "tgwire/request/params.hpp"
#include "tgwire/request/request.hpp"

namespace tgwire::request {

/// A request ready to be handed to a transport.
struct PreparedCall {
    OutgoingRequest request;
    std::string address;
};

/// Binds the endpoint configuration to a bot token.
class Api {
public:
    Api(ApiConfig config, std::string token);

    [[nodiscard]] auto config() const noexcept -> const ApiConfig& { return config_; }

    /// Address of `method` for this bot.
    [[nodiscard]] auto endpoint(std::string_view method) const -> Result<std::string>;

    [[nodiscard]] auto prepare(OutgoingRequest request) const -> Result<PreparedCall>;
    [[nodiscard]] auto prepare(std::string method, const ParameterMap& params) const
        -> Result<PreparedCall>;

    /// `text` with the token masked, for logs and diagnostics.
    [[nodiscard]] auto redacted(std::string_view text) const -> std::string;

private:
    ApiConfig config_;
    std::string token_;
};

} // namespace tgwire::request
