#include "tgwire/request/endpoint.hpp"

#include <charconv>
#include <regex>

#include "tgwire/core/logger.hpp"
#include "tgwire/core/utils.hpp"

namespace tgwire::request {

namespace {

// scheme, host (bracketed literal or reg-name), optional port, path.
const std::regex& url_pattern() {
    static const std::regex pattern(
        R"re(^https://(\[[0-9A-Fa-f:.]+\]|(?:[A-Za-z0-9._~!$&'()*+,;=-]|%[0-9A-Fa-f]{2})+))re"
        R"re((?::([0-9]{1,5}))?)re"
        R"re(((?:/(?:[A-Za-z0-9._~!$&'()*+,;=:@-]|%[0-9A-Fa-f]{2})+)*)$)re");
    return pattern;
}

auto path_of(std::string_view url) -> std::string {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(url.begin(), url.end(), m, url_pattern())) {
        return {};
    }
    return m[3].str();
}

} // anonymous namespace

auto is_valid_url(std::string_view url) -> bool {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(url.begin(), url.end(), m, url_pattern())) {
        return false;
    }
    if (m[2].matched) {
        unsigned port = 0;
        auto first = &*m[2].first;
        auto last = first + m[2].length();
        auto [ptr, ec] = std::from_chars(first, last, port);
        if (ec != std::errc{} || ptr != last || port > 65535) {
            return false;
        }
    }
    return true;
}

auto make_endpoint(const ApiConfig& config, std::string_view token, std::string_view method)
    -> Result<std::string> {
    if (method.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidEndpoint, "Method name is empty"));
    }

    std::string address = "https://" + config.host + "/" + config.path_prefix
                        + std::string(token) + "/" + std::string(method);

    if (!is_valid_url(address)) {
        LOG_DEBUG("Rejected endpoint {}", utils::redact(address, token));
        return std::unexpected(make_error(ErrorCode::InvalidEndpoint,
                                          "Endpoint is not a valid URL",
                                          std::string(method)));
    }

    // "/<prefix><token>/<method>" splits into "", segment, method.
    auto segments = utils::split(path_of(address), '/');
    if (segments.size() != 3) {
        LOG_DEBUG("Rejected endpoint {}: {} path segments",
                  utils::redact(address, token), segments.size() - 1);
        return std::unexpected(make_error(ErrorCode::InvalidEndpoint,
                                          "Endpoint must have exactly two path segments",
                                          std::string(method)));
    }

    return address;
}

} // namespace tgwire::request
