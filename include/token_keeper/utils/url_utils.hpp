#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace token_keeper {
namespace utils {

// Form encoding and the URL checks used by config validation
class UrlUtils {
public:
    using Params = std::vector<std::pair<std::string, std::string>>;

    static std::string encode(const std::string& str);
    static std::string build_query_string(const Params& params);
    static bool is_valid_url(const std::string& url);
    static std::optional<std::string> get_host(const std::string& url);
    static std::optional<std::string> get_scheme(const std::string& url);
};

} // namespace utils
} // namespace token_keeper
