#pragma once

#include <string>
#include <string_view>

#include "tgwire/request/params.hpp"

namespace tgwire::request {

/// Content type the transport must send the body with.
inline constexpr std::string_view kContentType = "application/json; charset=utf-8";

/// An assembled Bot API call: method name plus serialized JSON body.
/// Immutable once built.
class OutgoingRequest {
public:
    OutgoingRequest(std::string method, std::string body)
        : method_(std::move(method)), body_(std::move(body)) {}

    [[nodiscard]] auto method() const noexcept -> const std::string& { return method_; }
    [[nodiscard]] auto body() const noexcept -> const std::string& { return body_; }

    auto operator==(const OutgoingRequest&) const -> bool = default;

private:
    std::string method_;
    std::string body_;
};

/// Serializes the present entries of `params` into one compact UTF-8 JSON
/// object. An empty map yields `{}`. Strings that are not valid UTF-8
/// make nlohmann throw json::type_error.
auto assemble(std::string method, const ParameterMap& params) -> OutgoingRequest;

} // namespace tgwire::request
