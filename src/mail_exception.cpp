#include "threadmail/mail_exception.hpp"
#include "threadmail/constants.hpp"

MailException::MailException(std::string key, std::string di, bool retryable) :
    GenericException(key + ": " + di), retryable(retryable), key(key), debuginfo(di)
{

}

MailException::MailException(CURLcode c, std::string di) :
    GenericException(std::string(THREADMAIL_ERROR_RELAY) + ": " + curl_easy_strerror(c) + " " + di),
    key(THREADMAIL_ERROR_RELAY), debuginfo(std::string(curl_easy_strerror(c)) + " " + di)
{
    if ((c == CURLE_COULDNT_RESOLVE_PROXY) ||
        (c == CURLE_COULDNT_RESOLVE_HOST) ||
        (c == CURLE_COULDNT_CONNECT) ||
        (c == CURLE_OPERATION_TIMEDOUT) ||
        (c == CURLE_PARTIAL_FILE) ||
        (c == CURLE_HTTP_POST_ERROR) ||
        (c == CURLE_SSL_CONNECT_ERROR) ||
        (c == CURLE_GOT_NOTHING) ||
        (c == CURLE_SEND_ERROR) ||
        (c == CURLE_RECV_ERROR) ||
        (c == CURLE_AGAIN)) {
        retryable = true;
        offline = true;
    }
}

bool MailException::isRetryable() {
    return retryable;
}

bool MailException::isOffline() {
    return offline;
}

bool MailException::is(const char * k) {
    return key == k;
}

nlohmann::json MailException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}
