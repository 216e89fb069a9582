#include "token_keeper/services/network/http_client.hpp"
#include "token_keeper/utils/logger.hpp"
#include "token_keeper/utils/url_utils.hpp"
#include <curl/curl.h>
#include <chrono>

namespace token_keeper {
namespace services {

// Callback for writing HTTP response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpClientConfig& config = {}) : m_config(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~CurlHttpClient() override {
        curl_global_cleanup();
    }

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        LOG_DEBUG("CurlHttpClient", "Starting HTTP request to: " + request.url);

        if (!request.is_valid()) {
            LOG_ERROR("CurlHttpClient", "Invalid URL provided: " + request.url);
            return std::unexpected<NetworkError>(NetworkError::InvalidUrl);
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle");
            return std::unexpected<NetworkError>(NetworkError::ConnectionFailed);
        }

        std::string response_body;
        auto start_time = std::chrono::steady_clock::now();

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));

        struct curl_slist* header_list = setup_headers(request);
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }

        // Bounded request so a stalled server cannot block the caller forever
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_config.connect_timeout.count()));

        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);
        if (m_config.ca_cert_path) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, m_config.ca_cert_path->c_str());
        }

        CURLcode res = curl_easy_perform(curl);

        long response_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

        if (header_list) {
            curl_slist_free_all(header_list);
        }
        curl_easy_cleanup(curl);

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        if (res != CURLE_OK) {
            LOG_ERROR("CurlHttpClient", "HTTP request to " + request.url + " failed: " +
                      std::string(curl_easy_strerror(res)));
            return std::unexpected<NetworkError>(network_error_from_curl_code(static_cast<int>(res)));
        }

        LOG_DEBUG("CurlHttpClient", "HTTP request completed in " + std::to_string(duration.count()) +
                  "ms with status " + std::to_string(response_code));

        HttpResponse response;
        response.status_code = static_cast<int>(response_code);
        response.body = std::move(response_body);
        return response;
    }

    std::expected<HttpResponse, NetworkError> post(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers) override {
        HttpRequest request;
        request.url = url;
        request.body = body;
        request.headers = headers;
        request.timeout = m_config.default_timeout;
        request.verify_ssl = m_config.verify_ssl;
        return execute(request);
    }

    std::expected<HttpResponse, NetworkError> post_form(
        const std::string& url,
        const FormFields& fields,
        const HttpHeaders& headers) override {
        HttpHeaders form_headers = headers;
        form_headers["Content-Type"] = "application/x-www-form-urlencoded";
        return post(url, utils::UrlUtils::build_query_string(fields), form_headers);
    }

private:
    HttpClientConfig m_config;

    struct curl_slist* setup_headers(const HttpRequest& request) {
        struct curl_slist* header_list = nullptr;

        for (const auto& [key, value] : request.headers) {
            std::string header = key + ": " + value;
            header_list = curl_slist_append(header_list, header.c_str());
        }

        if (!m_config.user_agent.empty()) {
            std::string ua_header = "User-Agent: " + m_config.user_agent;
            header_list = curl_slist_append(header_list, ua_header.c_str());
        }

        return header_list;
    }
};

NetworkError network_error_from_curl_code(int code) {
    switch (static_cast<CURLcode>(code)) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetworkError::DNSResolutionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_CRL_BADFILE:
        case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        case CURLE_PEER_FAILED_VERIFICATION:
            return NetworkError::SSLError;
        case CURLE_TOO_MANY_REDIRECTS:
            return NetworkError::TooManyRedirects;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return NetworkError::InvalidUrl;
        case CURLE_ABORTED_BY_CALLBACK:
            return NetworkError::Cancelled;
        // The server answered but the body was cut off or could not be stored
        case CURLE_RECV_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_WRITE_ERROR:
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_FILESIZE_EXCEEDED:
            return NetworkError::BadResponse;
        default:
            // COULDNT_CONNECT, SEND_ERROR, GOT_NOTHING, proxy failures and the rest
            return NetworkError::ConnectionFailed;
    }
}

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    if (!config.is_valid()) {
        LOG_WARNING("CurlHttpClient", "HTTP client configuration has non-positive timeouts or an empty CA bundle path");
    }
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace token_keeper
