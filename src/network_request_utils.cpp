#include "threadmail/network_request_utils.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"

#include <algorithm>

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp) {
    std::string * buffer = (std::string *)userp;
    size_t real_size = length * nmemb;

    size_t oldLength = buffer->size();
    buffer->resize(oldLength + real_size);
    std::copy((char*)contents, (char*)contents + real_size, buffer->begin() + oldLength);

    return real_size;
}

CURL * CreateJSONRequest(std::string url, std::string method, const std::string & payload, long timeoutSec) {
    CURL * curl_handle = curl_easy_init();
    if (curl_handle == nullptr) {
        throw MailException(THREADMAIL_ERROR_RELAY, "curl_easy_init failed for " + url, true);
    }
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, timeoutSec);
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist *headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");

    if (payload.size() > 0) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, (long)payload.size());
        curl_easy_setopt(curl_handle, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    }
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_PRIVATE, (void *)headers);

    return curl_handle;
}

static void cleanupRequest(CURL * curl_handle) {
    char * priv = nullptr;
    curl_easy_getinfo(curl_handle, CURLINFO_PRIVATE, &priv);
    curl_easy_cleanup(curl_handle);
    if (priv != nullptr) {
        curl_slist_free_all((struct curl_slist *)priv);
    }
}

const std::string PerformRequest(CURL * curl_handle) {
    std::string result;
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&result);
    CURLcode res = curl_easy_perform(curl_handle);
    try {
        ValidateRequestResp(res, curl_handle, result);
    } catch (MailException &) {
        cleanupRequest(curl_handle);
        throw;
    }
    cleanupRequest(curl_handle);
    return result;
}

void ValidateRequestResp(CURLcode res, CURL * curl_handle, std::string resp) {
    char * _url = nullptr;
    std::string url = "<unknown>";
    if (curl_easy_getinfo(curl_handle, CURLINFO_EFFECTIVE_URL, &_url) == CURLE_OK && _url != nullptr) {
        url = std::string(_url);
    }

    if (res != CURLE_OK) {
        throw MailException(res, url);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code > 299) {
        bool retryable = (http_code >= 500);
        std::string debuginfo = url + " RETURNED " + std::to_string(http_code) + " " + resp;
        throw MailException(THREADMAIL_ERROR_RELAY, debuginfo, retryable);
    }
}
