#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "TestSupport.hpp"
#include "MockRelayClient.hpp"
#include "threadmail/attachment_store.hpp"
#include "threadmail/http_frontend.hpp"
#include "threadmail/ingestion_adapter.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/message_store.hpp"

#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <set>

using namespace std;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class HttpFrontendTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnsureTestLogger();
        dir = MakeTestDir("http");
        store = new MessageStore(dir + "/threadmail.db");
        store->migrate();
        accounts = new AccountDirectory(dir + "/accounts.json", "localhost", true);
        hub = new DeliveryHub(dir + "/threadmail.db", 1, chrono::seconds(0));
        relay = new NiceMock<MockRelayClient>();
        attachments = new LocalAttachmentStore(dir + "/attachments");
        ingestion = new IngestionAdapter(accounts, hub, relay, attachments);
        frontend = new HttpFrontend(dir + "/threadmail.db", accounts, ingestion, hub);
    }

    void TearDown() override {
        delete frontend;
        delete ingestion;
        delete attachments;
        delete relay;
        delete hub;
        delete accounts;
        delete store;
        RemoveTestDir(dir);
    }

    HttpRequest request(string method, string path, string user = "", string password = "") {
        HttpRequest r;
        r.method = method;
        r.path = path;
        if (user.size()) {
            r.headers["authorization"] = "Basic " + MailUtils::toBase64(user + ":" + password);
        }
        return r;
    }

    HttpRequest asAlice(string method, string path) {
        return request(method, path, "alice", "password123");
    }

    HttpRequest asBob(string method, string path) {
        return request(method, path, "bob", "password456");
    }

    HttpRequest asCharlie(string method, string path) {
        return request(method, path, "charlie", "password789");
    }

    nlohmann::json bodyOf(const HttpResponse & response) {
        return nlohmann::json::parse(response.body);
    }

    shared_ptr<Message> sendAsAlice(string to, string subject) {
        SendRequest r;
        r.to = to;
        r.subject = subject;
        r.body = "Body";
        auto result = ingestion->send(*store, *accounts->findByUsername("alice"), r);
        return result.stored;
    }

    string dir;
    MessageStore * store;
    AccountDirectory * accounts;
    DeliveryHub * hub;
    NiceMock<MockRelayClient> * relay;
    LocalAttachmentStore * attachments;
    IngestionAdapter * ingestion;
    HttpFrontend * frontend;
};

TEST_F(HttpFrontendTest, HealthNeedsNoCredentials) {
    auto response = frontend->route(*store, request("GET", "/api/health"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(bodyOf(response)["status"], "healthy");
    EXPECT_EQ(bodyOf(response)["server"], "localhost");
}

TEST_F(HttpFrontendTest, ApiRequiresCredentials) {
    auto missing = frontend->route(*store, request("GET", "/api/messages"));
    EXPECT_EQ(missing.status, 401);
    EXPECT_EQ(missing.headers.at("WWW-Authenticate"), "Basic realm=\"threadmail\"");

    auto wrong = frontend->route(*store, request("GET", "/api/messages", "alice", "nope"));
    EXPECT_EQ(wrong.status, 401);

    auto garbage = request("GET", "/api/messages");
    garbage.headers["authorization"] = "Basic !!!";
    EXPECT_EQ(frontend->route(*store, garbage).status, 401);
}

TEST_F(HttpFrontendTest, TokenOnlyAcceptedWhenAllowed) {
    auto r = request("GET", "/api/sse/inbox");
    r.query["token"] = MailUtils::toBase64("bob:password456");

    auto account = frontend->authenticate(r, true);
    ASSERT_NE(account, nullptr);
    EXPECT_EQ(account->username(), "bob");
    EXPECT_EQ(frontend->authenticate(r, false), nullptr);

    r.query["token"] = MailUtils::toBase64("bob-without-colon");
    EXPECT_EQ(frontend->authenticate(r, true), nullptr);
}

TEST_F(HttpFrontendTest, PreflightAllowsCrossOrigin) {
    auto response = frontend->route(*store, request("OPTIONS", "/api/send"));
    EXPECT_EQ(response.status, 204);
    EXPECT_EQ(response.headers.at("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");

    string wire = response.serialize();
    EXPECT_EQ(wire.find("HTTP/1.1 204 No Content\r\n"), 0u);
    EXPECT_THAT(wire, HasSubstr("Access-Control-Allow-Origin: *\r\n"));
    EXPECT_THAT(wire, HasSubstr("Connection: close\r\n"));
}

TEST_F(HttpFrontendTest, SerializesJsonResponses) {
    auto response = HttpResponse::error(404, "Not found");
    string wire = response.serialize();
    EXPECT_EQ(wire.find("HTTP/1.1 404 Not Found\r\n"), 0u);
    EXPECT_THAT(wire, HasSubstr("Content-Type: application/json\r\n"));
    EXPECT_THAT(wire, HasSubstr("Content-Length: 21\r\n"));
    EXPECT_EQ(wire.substr(wire.size() - 21), "{\"error\":\"Not found\"}");
}

TEST_F(HttpFrontendTest, SendStoresMessage) {
    auto r = asAlice("POST", "/api/send");
    r.body = nlohmann::json({{"to", "bob@localhost"}, {"subject", "Hi"}, {"body", "Hello"}}).dump();

    auto response = frontend->route(*store, r);
    EXPECT_EQ(response.status, 200);
    auto body = bodyOf(response);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["message"], "Message sent successfully");
    EXPECT_TRUE(body["thread_id"].is_string());
    EXPECT_EQ(store->unreadCount(2), 1);
}

TEST_F(HttpFrontendTest, SendRejectsBadInput) {
    auto notJson = asAlice("POST", "/api/send");
    notJson.body = "{not json";
    auto response = frontend->route(*store, notJson);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(bodyOf(response)["error"], "invalid_json");

    auto noSubject = asAlice("POST", "/api/send");
    noSubject.body = nlohmann::json({{"to", "bob@localhost"}}).dump();
    response = frontend->route(*store, noSubject);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(bodyOf(response)["error"], "missing_subject");

    auto badType = asAlice("POST", "/api/send");
    badType.body = nlohmann::json({{"to", 5}, {"subject", "x"}}).dump();
    EXPECT_EQ(frontend->route(*store, badType).status, 400);

    EXPECT_EQ(frontend->route(*store, asAlice("GET", "/api/send")).status, 405);
}

TEST_F(HttpFrontendTest, InboxListsThreadRootsWithReplies) {
    auto root = sendAsAlice("bob@localhost", "Hi");
    SendRequest reply;
    reply.to = "bob@localhost";
    reply.subject = "Re: Hi";
    reply.parentId = root->id();
    ingestion->send(*store, *accounts->findByUsername("alice"), reply);

    auto response = frontend->route(*store, asBob("GET", "/api/messages"));
    EXPECT_EQ(response.status, 200);
    auto body = bodyOf(response);
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["id"], root->id());
    ASSERT_EQ(body[0]["replies"].size(), 1u);
    EXPECT_EQ(body[0]["replies"][0]["subject"], "Re: Hi");
}

TEST_F(HttpFrontendTest, InboxValidatesPaging) {
    for (string bad : {"0", "101", "abc"}) {
        auto r = asBob("GET", "/api/messages");
        r.query["limit"] = bad;
        EXPECT_EQ(frontend->route(*store, r).status, 400) << bad;
    }
    auto negative = asBob("GET", "/api/messages");
    negative.query["offset"] = "-1";
    EXPECT_EQ(frontend->route(*store, negative).status, 400);

    for (int i = 0; i < 3; i++) {
        sendAsAlice("bob@localhost", "Message " + to_string(i));
    }
    auto paged = asBob("GET", "/api/messages");
    paged.query["limit"] = "2";
    paged.query["offset"] = "1";
    auto response = frontend->route(*store, paged);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(bodyOf(response).size(), 2u);
}

TEST_F(HttpFrontendTest, SentAndUnreadCount) {
    sendAsAlice("bob@localhost", "One");
    sendAsAlice("bob@localhost", "Two");

    auto sent = frontend->route(*store, asAlice("GET", "/api/messages/sent"));
    EXPECT_EQ(sent.status, 200);
    EXPECT_EQ(bodyOf(sent).size(), 2u);

    auto unread = frontend->route(*store, asBob("GET", "/api/messages/unread-count"));
    EXPECT_EQ(unread.status, 200);
    EXPECT_EQ(bodyOf(unread)["unread_count"], 2);
}

TEST_F(HttpFrontendTest, MarkReadIsLimitedToRecipient) {
    auto msg = sendAsAlice("bob@localhost", "Hi");
    string path = "/api/messages/" + to_string(msg->id()) + "/read";

    EXPECT_EQ(frontend->route(*store, asAlice("POST", path)).status, 403);
    EXPECT_EQ(frontend->route(*store, asBob("POST", "/api/messages/999/read")).status, 404);
    EXPECT_EQ(frontend->route(*store, asBob("POST", "/api/messages/abc/read")).status, 400);

    auto response = frontend->route(*store, asBob("POST", path));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(bodyOf(response)["status"], "success");
    EXPECT_EQ(store->unreadCount(2), 0);
}

TEST_F(HttpFrontendTest, ThreadOnlyShowsParticipantsMessages) {
    auto msg = sendAsAlice("bob@localhost", "Hi");
    string path = "/api/threads/" + msg->threadId();

    auto forBob = frontend->route(*store, asBob("GET", path));
    EXPECT_EQ(forBob.status, 200);
    EXPECT_EQ(bodyOf(forBob).size(), 1u);

    EXPECT_EQ(frontend->route(*store, asCharlie("GET", path)).status, 404);
    EXPECT_EQ(frontend->route(*store, asBob("GET", "/api/threads/missing")).status, 404);
}

TEST_F(HttpFrontendTest, AttachmentDownloadIsLimitedToParticipants) {
    auto r = asAlice("POST", "/api/send");
    r.body = nlohmann::json({
        {"to", "bob@localhost"},
        {"subject", "File"},
        {"attachments", {{{"filename", "report \"q1\".txt"}, {"content_type", "text/plain"}, {"data", MailUtils::toBase64("numbers")}}}},
    }).dump();
    auto sent = frontend->route(*store, r);
    ASSERT_EQ(sent.status, 200);
    auto saved = store->getAttachments(bodyOf(sent)["id"].get<int64_t>());
    ASSERT_EQ(saved.size(), 1u);
    string path = "/api/attachments/" + to_string(saved[0]->id());

    auto download = frontend->route(*store, asBob("GET", path));
    EXPECT_EQ(download.status, 200);
    EXPECT_EQ(download.body, "numbers");
    EXPECT_EQ(download.contentType, "text/plain");
    EXPECT_THAT(download.headers.at("Content-Disposition"), HasSubstr("attachment; filename="));
    EXPECT_EQ(download.headers.at("Content-Disposition").find("\"q1\""), string::npos);

    EXPECT_EQ(frontend->route(*store, asCharlie("GET", path)).status, 403);
    EXPECT_EQ(frontend->route(*store, asBob("GET", "/api/attachments/999")).status, 404);
    EXPECT_EQ(frontend->route(*store, asBob("GET", "/api/attachments/x")).status, 400);
}

TEST_F(HttpFrontendTest, AttachmentsWithSameFilenameKeepTheirOwnBytes) {
    auto r = asAlice("POST", "/api/send");
    r.body = nlohmann::json({
        {"to", "bob@localhost"},
        {"subject", "Two files"},
        {"attachments", {
            {{"filename", "a.txt"}, {"content_type", "text/plain"}, {"data", MailUtils::toBase64("A")}},
            {{"filename", "a.txt"}, {"content_type", "text/plain"}, {"data", MailUtils::toBase64("B")}},
        }},
    }).dump();
    auto sent = frontend->route(*store, r);
    ASSERT_EQ(sent.status, 200);
    EXPECT_EQ(bodyOf(sent)["attachments"]["processed"], 2);

    auto saved = store->getAttachments(bodyOf(sent)["id"].get<int64_t>());
    ASSERT_EQ(saved.size(), 2u);
    EXPECT_NE(saved[0]->path(), saved[1]->path());

    set<string> contents;
    for (const auto & attachment : saved) {
        auto download = frontend->route(*store, asBob("GET", "/api/attachments/" + to_string(attachment->id())));
        EXPECT_EQ(download.status, 200);
        contents.insert(download.body);
    }
    EXPECT_EQ(contents, (set<string>{"A", "B"}));
}

TEST_F(HttpFrontendTest, InvalidUTF8BodyIsListedWithReplacement) {
    SendRequest s;
    s.to = "bob@localhost";
    s.subject = "Latin-1";
    s.body = string("caf\xe9");
    auto result = ingestion->send(*store, *accounts->findByUsername("alice"), s);
    ASSERT_TRUE(result.success);

    auto inbox = frontend->route(*store, asBob("GET", "/api/messages"));
    EXPECT_EQ(inbox.status, 200);
    EXPECT_THAT(inbox.body, HasSubstr("caf\xEF\xBF\xBD"));
    EXPECT_EQ(frontend->route(*store, asBob("GET", "/api/threads/" + result.stored->threadId())).status, 200);
}

TEST_F(HttpFrontendTest, RelayEndpointAcceptsEnvelopes) {
    auto r = request("POST", "/federation/relay");
    r.body = nlohmann::json({{"from", "dave@remote.example"}, {"to", "bob@localhost"}, {"subject", "Hi"}, {"body", "x"}}).dump();
    auto response = frontend->route(*store, r);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(bodyOf(response)["message"], "Message relayed successfully");

    r.body = "nonsense";
    response = frontend->route(*store, r);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(bodyOf(response)["error"], "invalid_json");

    EXPECT_EQ(frontend->route(*store, request("GET", "/federation/relay")).status, 405);
}

TEST_F(HttpFrontendTest, UnknownRoutesAreNotFound) {
    EXPECT_EQ(frontend->route(*store, asBob("GET", "/api/nothing")).status, 404);
    EXPECT_EQ(frontend->route(*store, request("GET", "/index.html")).status, 404);
}

TEST_F(HttpFrontendTest, ResolverOutageIsServiceUnavailable) {
    UnavailableResolver unavailable;
    HttpFrontend offline(dir + "/threadmail.db", &unavailable, ingestion, hub);
    EXPECT_EQ(offline.route(*store, asBob("GET", "/api/messages")).status, 503);
}

TEST_F(HttpFrontendTest, DecodesUrlEscapes) {
    EXPECT_EQ(HttpRequest::urlDecode("a%20b+c"), "a b c");
    EXPECT_EQ(HttpRequest::urlDecode("%3D%3d"), "==");
    EXPECT_EQ(HttpRequest::urlDecode("100%"), "100%");
    EXPECT_EQ(HttpRequest::urlDecode("%zz"), "%zz");
}

class HttpRequestReadTest : public ::testing::Test {
protected:
    int fds[2];
    shared_ptr<SocketConnection> server;

    void SetUp() override {
        EnsureTestLogger();
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        server = make_shared<SocketConnection>(fds[0], "pair");
    }

    void TearDown() override {
        server.reset();
        if (fds[1] >= 0) {
            ::close(fds[1]);
        }
    }

    void clientSends(const string & data) {
        ASSERT_EQ(::write(fds[1], data.data(), data.size()), (ssize_t)data.size());
    }

    void clientHangsUp() {
        ::close(fds[1]);
        fds[1] = -1;
    }
};

TEST_F(HttpRequestReadTest, ParsesRequestLineHeadersAndBody) {
    clientSends("POST /api/send?limit=5&name=a%20b HTTP/1.1\r\nHost: x\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n{}");

    HttpRequest r;
    ASSERT_TRUE(HttpRequest::read(*server, r));
    EXPECT_EQ(r.method, "POST");
    EXPECT_EQ(r.path, "/api/send");
    EXPECT_EQ(r.param("limit"), "5");
    EXPECT_EQ(r.param("name"), "a b");
    EXPECT_EQ(r.header("content-type"), "application/json");
    EXPECT_EQ(r.body, "{}");
}

TEST_F(HttpRequestReadTest, CleanHangupReturnsFalse) {
    clientHangsUp();
    HttpRequest r;
    EXPECT_FALSE(HttpRequest::read(*server, r));
}

TEST_F(HttpRequestReadTest, MalformedRequestsThrow) {
    clientSends("NONSENSE\r\n\r\n");
    HttpRequest r;
    EXPECT_THROW(HttpRequest::read(*server, r), MailException);
}

TEST_F(HttpRequestReadTest, OversizedBodyIsRejectedBeforeReading) {
    clientSends("POST /api/send HTTP/1.1\r\nContent-Length: " + to_string((int64_t)THREADMAIL_MAX_REQUEST_BYTES + 1) + "\r\n\r\n");
    HttpRequest r;
    EXPECT_THROW(HttpRequest::read(*server, r), MailException);
}
