#include "http.hpp"
#include "scry/errors.hpp"
#include <curl/curl.h>
#include <mutex>
#include <cstdlib>

namespace scry::engine::http {

    namespace {

        size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }

        void global_init() {
            static std::once_flag once;
            std::call_once(once, [] {
                curl_global_init(CURL_GLOBAL_DEFAULT);
                std::atexit(curl_global_cleanup);
            });
        }

    }

    Response post_json(const std::string& url,
                       const std::string& body,
                       const std::vector<std::string>& headers,
                       long timeout_ms) {
        global_init();

        CURL* curl = curl_easy_init();
        if (!curl) throw RemoteBackendError("curl_easy_init() failed");

        struct curl_slist* header_list = nullptr;
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
        for (const auto& h : headers) {
            header_list = curl_slist_append(header_list, h.c_str());
        }

        Response response;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (timeout_ms > 0) curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        }

        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            throw RemoteBackendError(std::string("request to ") + url + " failed: " + curl_easy_strerror(res));
        }
        return response;
    }

}
