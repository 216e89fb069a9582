#include "token_keeper/utils/url_utils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace token_keeper {
namespace utils {

std::string UrlUtils::encode(const std::string& str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex;

    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << std::uppercase;
            encoded << '%' << std::setw(2) << static_cast<int>(uc);
            encoded << std::nouppercase;
        }
    }

    return encoded.str();
}

std::string UrlUtils::build_query_string(const Params& params) {
    std::ostringstream oss;
    bool first = true;

    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << encode(key) << "=" << encode(value);
        first = false;
    }

    return oss.str();
}

bool UrlUtils::is_valid_url(const std::string& url) {
    auto scheme = get_scheme(url);
    if (!scheme || (*scheme != "http" && *scheme != "https")) {
        return false;
    }
    return get_host(url).has_value();
}

std::optional<std::string> UrlUtils::get_host(const std::string& url) {
    size_t scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos) return std::nullopt;

    size_t host_start = scheme_pos + 3;
    size_t host_end = url.find_first_of(":/?#", host_start);
    if (host_end == std::string::npos) host_end = url.length();

    if (host_start >= host_end) return std::nullopt;

    return url.substr(host_start, host_end - host_start);
}

std::optional<std::string> UrlUtils::get_scheme(const std::string& url) {
    size_t scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos || scheme_pos == 0) {
        return std::nullopt;
    }
    return url.substr(0, scheme_pos);
}

} // namespace utils
} // namespace token_keeper
