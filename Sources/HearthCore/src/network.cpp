#include "hearth/network.hpp"
#include "hearth/log.hpp"
#include <curl/curl.h>
#include <cctype>

namespace hearth {

namespace {

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// curl_slist built from strings that outlive the request
struct header_list {
    std::vector<std::string> store;
    curl_slist* list = nullptr;

    ~header_list() { curl_slist_free_all(list); }

    void add(const std::string& h) {
        store.push_back(h);
        list = curl_slist_append(list, store.back().c_str());
    }
};

struct curl_handle {
    CURL* curl = curl_easy_init();
    ~curl_handle() { if (curl) curl_easy_cleanup(curl); }
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    body->insert(body->end(), ptr, ptr + size * nmemb);
    return size * nmemb;
}

size_t write_header(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(ptr, size * nmemb);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        auto trim = [](std::string& s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
        };
        trim(name);
        trim(value);
        for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        (*headers)[name] = value;
    }
    return size * nmemb;
}

} // namespace

curl_http_client::curl_http_client(long timeout_seconds) : timeout_seconds_(timeout_seconds) {
    ensure_curl_global_init();
}

http_response curl_http_client::send(const http_request& request) {
    curl_handle handle;
    if (!handle.curl) {
        throw remote_error("curl_easy_init failed");
    }
    CURL* curl = handle.curl;

    header_list headers;
    for (const auto& [name, value] : request.headers) {
        headers.add(name + ": " + value);
    }

    http_response response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if (!request.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        LOG_ERROR("http", "%s %s failed: %s", request.method.c_str(), request.url.c_str(),
                  curl_easy_strerror(res));
        throw remote_error(std::string("HTTP request failed: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);
    LOG_DEBUG("http", "%s %s -> %d", request.method.c_str(), request.url.c_str(), response.status_code);
    return response;
}

} // namespace hearth
