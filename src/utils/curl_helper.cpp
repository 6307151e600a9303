#include "utils/curl_helper.hpp"
#include "utils/string_utils.hpp"

namespace jukebox {

void CurlHelper::global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHelper::global_cleanup() {
    curl_global_cleanup();
}

size_t CurlHelper::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t CurlHelper::header_callback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* headers) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = string_utils::to_lower(string_utils::trim(header.substr(0, colon_pos)));
        (*headers)[key] = string_utils::trim(header.substr(colon_pos + 1));
    }

    return total_size;
}

CurlHelper::Response CurlHelper::perform(CURL* curl, const std::map<std::string, std::string>& headers) {
    Response response;

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "jukebox/1.0");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_str = key + ": " + value;
        header_list = curl_slist_append(header_list, header_str.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        response.success = response.status_code >= 200 && response.status_code < 300;
        if (!response.success) {
            response.error = "HTTP " + std::to_string(response.status_code);
        }
    } else {
        response.error = curl_easy_strerror(res);
    }

    if (header_list) {
        curl_slist_free_all(header_list);
    }
    curl_easy_cleanup(curl);

    return response;
}

CurlHelper::Response CurlHelper::get(const std::string& url, const std::map<std::string, std::string>& headers) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        Response response;
        response.error = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    return perform(curl, headers);
}

CurlHelper::Response CurlHelper::post(const std::string& url, const std::string& body,
                                      const std::map<std::string, std::string>& headers,
                                      const std::optional<BasicAuth>& auth) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        Response response;
        response.error = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    if (auth) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERNAME, auth->first.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, auth->second.c_str());
    }

    return perform(curl, headers);
}

} // namespace jukebox
