#include "token_keeper/services/network/http_types.hpp"
#include "token_keeper/services/network/http_client.hpp"
#include "token_keeper/utils/url_utils.hpp"

namespace token_keeper {
namespace services {

bool HttpRequest::is_valid() const {
    return !url.empty() && utils::UrlUtils::is_valid_url(url);
}

bool HttpClientConfig::is_valid() const {
    return default_timeout.count() > 0 &&
           connect_timeout.count() > 0 &&
           (!ca_cert_path || !ca_cert_path->empty());
}

} // namespace services
} // namespace token_keeper
