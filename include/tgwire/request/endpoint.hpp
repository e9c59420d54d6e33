#pragma once

#include <string>
#include <string_view>

#include "tgwire/core/config.hpp"
#include "tgwire/core/error.hpp"

namespace tgwire::request {

/// True for an absolute `https://` URL whose host is an RFC 3986
/// reg-name, IPv4 or bracketed IPv6 literal, with an optional port up to
/// 65535 and non-empty path segments made of pchar characters. Query and
/// fragment are not allowed.
auto is_valid_url(std::string_view url) -> bool;

/// Builds `https://<host>/<path_prefix><token>/<method>`. Fails with
/// ErrorCode::InvalidEndpoint when the result is not a valid URL or does
/// not have exactly two path segments (a token containing '/' would add
/// one).
auto make_endpoint(const ApiConfig& config, std::string_view token, std::string_view method)
    -> Result<std::string>;

} // namespace tgwire::request
