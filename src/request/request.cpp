#include "tgwire/request/request.hpp"

#include "tgwire/core/logger.hpp"

namespace tgwire::request {

auto assemble(std::string method, const ParameterMap& params) -> OutgoingRequest {
    auto body = params.encode().dump();
    LOG_TRACE("Assembled {} with {} parameter(s), {} bytes", method, params.size(), body.size());
    return OutgoingRequest(std::move(method), std::move(body));
}

} // namespace tgwire::request
