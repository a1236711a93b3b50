#ifndef MOCKRELAYCLIENT_HPP
#define MOCKRELAYCLIENT_HPP

#include <gmock/gmock.h>
#include <string>

#include "threadmail/relay_client.hpp"

class MockRelayClient : public RelayClient {
public:
    MockRelayClient() : RelayClient("localhost", 8080, 1) {}

    MOCK_METHOD(void, sendMessage, (std::string from, std::string to, std::string subject, std::string body, std::string targetHost), (override));
};

#endif // MOCKRELAYCLIENT_HPP
