#include "tgwire/request/api.hpp"

#include "tgwire/core/logger.hpp"
#include "tgwire/core/utils.hpp"
#include "tgwire/request/endpoint.hpp"

namespace tgwire::request {

Api::Api(ApiConfig config, std::string token)
    : config_(std::move(config)), token_(std::move(token)) {}

auto Api::endpoint(std::string_view method) const -> Result<std::string> {
    return make_endpoint(config_, token_, method);
}

auto Api::prepare(OutgoingRequest request) const -> Result<PreparedCall> {
    auto address = endpoint(request.method());
    if (!address) {
        return std::unexpected(address.error());
    }
    LOG_DEBUG("Prepared {} -> {}", request.method(), redacted(*address));
    return PreparedCall{
        .request = std::move(request),
        .address = std::move(*address),
    };
}

auto Api::prepare(std::string method, const ParameterMap& params) const -> Result<PreparedCall> {
    return prepare(assemble(std::move(method), params));
}

auto Api::redacted(std::string_view text) const -> std::string {
    return utils::redact(text, token_);
}

} // namespace tgwire::request
