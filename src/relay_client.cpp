#include "threadmail/relay_client.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/network_request_utils.hpp"

#include "spdlog/spdlog.h"

RelayClient::RelayClient(std::string serverHost, int relayPort, long timeoutSec) :
    _serverHost(serverHost), _relayPort(relayPort), _timeoutSec(timeoutSec)
{
}

bool RelayClient::isSelf(std::string targetHost) {
    return MailUtils::toUpper(targetHost) == MailUtils::toUpper(_serverHost);
}

std::string RelayClient::endpointFor(std::string targetHost) {
    return "http://" + targetHost + ":" + std::to_string(_relayPort) + THREADMAIL_RELAY_PATH;
}

nlohmann::json RelayClient::envelopeFor(std::string from, std::string to, std::string subject, std::string body, int64_t timestamp) {
    return {
        {"from", from},
        {"to", to},
        {"subject", subject},
        {"body", body},
        {"timestamp", MailUtils::timestampForTime(timestamp)},
    };
}

void RelayClient::sendMessage(std::string from, std::string to, std::string subject, std::string body, std::string targetHost) {
    if (isSelf(targetHost)) {
        return;
    }
    if (targetHost == "") {
        throw MailException(THREADMAIL_ERROR_VALIDATION, "No relay target host for " + to);
    }

    std::string url = endpointFor(targetHost);
    std::string payload = MailUtils::dumpJSON(envelopeFor(from, to, subject, body, MailUtils::nowMilliseconds()));

    auto logger = spdlog::get("logger");
    logger->info("Relaying message for {} to {}", to, url);

    CURL * curl_handle = CreateJSONRequest(url, "POST", payload, _timeoutSec);
    PerformRequest(curl_handle);

    logger->info("Relay to {} succeeded", targetHost);
}
