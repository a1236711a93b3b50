#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "threadmail/http_frontend.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/relay_client.hpp"
#include "threadmail/tcp_socket.hpp"
#include <memory>
#include <thread>

using namespace std;

// Accepts a single HTTP request, records it and answers with a fixed status.
class OneShotResponder {
    TcpListener _listener;
    thread * _thread = nullptr;

public:
    HttpRequest received;
    bool gotRequest = false;

    void start(int status) {
        _listener.listen(0);
        _thread = new thread([this, status]() {
            string peer;
            int fd = _listener.accept(peer);
            if (fd < 0) {
                return;
            }
            SocketConnection conn(fd, peer);
            try {
                gotRequest = HttpRequest::read(conn, received);
            } catch (MailException &) {
                gotRequest = false;
            }
            conn.writeRaw(HttpResponse::error(status, status == 200 ? "ok" : "nope").serialize());
            conn.close();
        });
    }

    int port() {
        return _listener.port();
    }

    void join() {
        if (_thread) {
            _thread->join();
            delete _thread;
            _thread = nullptr;
        }
    }

    ~OneShotResponder() {
        _listener.close();
        join();
    }
};

class RelayClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnsureTestLogger();
    }
};

TEST_F(RelayClientTest, EndpointAndEnvelope) {
    RelayClient relay("mail.local", 9090, 5);
    EXPECT_EQ(relay.endpointFor("remote.example"), "http://remote.example:9090/federation/relay");

    auto envelope = relay.envelopeFor("a@mail.local", "b@remote.example", "Hi", "Body", 1700000000000);
    EXPECT_EQ(envelope["from"], "a@mail.local");
    EXPECT_EQ(envelope["to"], "b@remote.example");
    EXPECT_EQ(envelope["subject"], "Hi");
    EXPECT_EQ(envelope["body"], "Body");
    EXPECT_EQ(envelope["timestamp"], "2023-11-14T22:13:20Z");
}

TEST_F(RelayClientTest, OwnHostIsNeverContacted) {
    RelayClient relay("Mail.Local", 1, 1);
    EXPECT_TRUE(relay.isSelf("mail.local"));
    EXPECT_NO_THROW(relay.sendMessage("a@mail.local", "ghost@mail.local", "Hi", "Body", "mail.local"));
}

TEST_F(RelayClientTest, MissingHostIsAValidationError) {
    RelayClient relay("mail.local", 8080, 1);
    try {
        relay.sendMessage("a@mail.local", "b", "Hi", "Body", "");
        FAIL() << "Expected a validation error";
    } catch (MailException & ex) {
        EXPECT_TRUE(ex.is(THREADMAIL_ERROR_VALIDATION));
    }
}

TEST_F(RelayClientTest, PostsEnvelopeToRemoteServer) {
    OneShotResponder responder;
    responder.start(200);

    RelayClient relay("mail.local", responder.port(), 5);
    EXPECT_NO_THROW(relay.sendMessage("a@mail.local", "b@127.0.0.1", "Hi", "Body", "127.0.0.1"));
    responder.join();

    ASSERT_TRUE(responder.gotRequest);
    EXPECT_EQ(responder.received.method, "POST");
    EXPECT_EQ(responder.received.path, "/federation/relay");
    EXPECT_EQ(responder.received.header("content-type"), "application/json");

    auto body = nlohmann::json::parse(responder.received.body);
    EXPECT_EQ(body["from"], "a@mail.local");
    EXPECT_EQ(body["to"], "b@127.0.0.1");
    EXPECT_EQ(body["subject"], "Hi");
    EXPECT_TRUE(body["timestamp"].is_string());
}

TEST_F(RelayClientTest, InvalidUTF8IsReplacedInEnvelope) {
    OneShotResponder responder;
    responder.start(200);

    RelayClient relay("mail.local", responder.port(), 5);
    EXPECT_NO_THROW(relay.sendMessage("a@mail.local", "b@127.0.0.1", "Hi", std::string("caf\xe9"), "127.0.0.1"));
    responder.join();

    ASSERT_TRUE(responder.gotRequest);
    auto body = nlohmann::json::parse(responder.received.body);
    EXPECT_EQ(body["body"], "caf\xEF\xBF\xBD");
}

TEST_F(RelayClientTest, ServerErrorIsRetryableRelayError) {
    OneShotResponder responder;
    responder.start(500);

    RelayClient relay("mail.local", responder.port(), 5);
    try {
        relay.sendMessage("a@mail.local", "b@127.0.0.1", "Hi", "Body", "127.0.0.1");
        FAIL() << "Expected a relay error";
    } catch (MailException & ex) {
        EXPECT_TRUE(ex.is(THREADMAIL_ERROR_RELAY));
        EXPECT_TRUE(ex.isRetryable());
        EXPECT_NE(ex.debuginfo.find("500"), string::npos);
    }
}

TEST_F(RelayClientTest, RejectionIsNotRetryable) {
    OneShotResponder responder;
    responder.start(404);

    RelayClient relay("mail.local", responder.port(), 5);
    try {
        relay.sendMessage("a@mail.local", "b@127.0.0.1", "Hi", "Body", "127.0.0.1");
        FAIL() << "Expected a relay error";
    } catch (MailException & ex) {
        EXPECT_TRUE(ex.is(THREADMAIL_ERROR_RELAY));
        EXPECT_FALSE(ex.isRetryable());
    }
}

TEST_F(RelayClientTest, UnreachableServerIsRetryable) {
    // Bind and release a port so nothing is listening on it.
    int port = 0;
    {
        TcpListener listener;
        listener.listen(0);
        port = listener.port();
    }
    RelayClient relay("mail.local", port, 2);
    try {
        relay.sendMessage("a@mail.local", "b@127.0.0.1", "Hi", "Body", "127.0.0.1");
        FAIL() << "Expected a relay error";
    } catch (MailException & ex) {
        EXPECT_TRUE(ex.is(THREADMAIL_ERROR_RELAY));
        EXPECT_TRUE(ex.isRetryable());
        EXPECT_TRUE(ex.isOffline());
    }
}
