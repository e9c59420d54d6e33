#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tgwire::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;

/// Replaces every occurrence of `secret` in `text` with "<redacted>".
/// An empty secret leaves the text unchanged.
auto redact(std::string_view text, std::string_view secret) -> std::string;

} // namespace tgwire::utils
