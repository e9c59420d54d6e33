#include "tgwire/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace tgwire::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto redact(std::string_view text, std::string_view secret) -> std::string {
    if (secret.empty()) return std::string(text);

    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (true) {
        auto hit = text.find(secret, pos);
        if (hit == std::string_view::npos) {
            result.append(text.substr(pos));
            break;
        }
        result.append(text.substr(pos, hit - pos));
        result.append("<redacted>");
        pos = hit + secret.size();
    }
    return result;
}

} // namespace tgwire::utils
