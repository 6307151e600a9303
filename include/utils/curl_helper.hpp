#pragma once

#include <string>
#include <map>
#include <optional>
#include <utility>
#include <curl/curl.h>

namespace jukebox {

class CurlHelper {
public:
    struct Response {
        long status_code = 0;
        std::string body;
        std::map<std::string, std::string> headers;
        bool success = false;
        std::string error;
    };

    // user, password
    using BasicAuth = std::pair<std::string, std::string>;

    // Initialize/cleanup curl globally
    static void global_init();
    static void global_cleanup();

    static Response get(const std::string& url,
                        const std::map<std::string, std::string>& headers = {});

    // Form-encoded body unless a Content-Type header says otherwise
    static Response post(const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers = {},
                         const std::optional<BasicAuth>& auth = std::nullopt);

private:
    static Response perform(CURL* curl, const std::map<std::string, std::string>& headers);
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* headers);
};

} // namespace jukebox
