#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "TestSupport.hpp"
#include "MockRelayClient.hpp"
#include "threadmail/attachment_store.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/delivery_hub.hpp"
#include "threadmail/identity_resolver.hpp"
#include "threadmail/ingestion_adapter.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/message_store.hpp"
#include <fstream>
#include <iterator>
#include <memory>

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Throw;

class IngestionAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnsureTestLogger();
        dir = MakeTestDir("ingestion");
        store = new MessageStore(dir + "/threadmail.db");
        store->migrate();
        accounts = new AccountDirectory(dir + "/accounts.json", "localhost", true);
        hub = new DeliveryHub(dir + "/threadmail.db", 1, std::chrono::seconds(0));
        relay = new NiceMock<MockRelayClient>();
        attachments = new LocalAttachmentStore(dir + "/attachments");
        adapter = new IngestionAdapter(accounts, hub, relay, attachments);
        alice = accounts->findByUsername("alice");
    }

    void TearDown() override {
        delete adapter;
        delete attachments;
        delete relay;
        delete hub;
        delete accounts;
        delete store;
        RemoveTestDir(dir);
    }

    SendRequest request(std::string to, std::string subject, std::string body) {
        SendRequest r;
        r.to = to;
        r.subject = subject;
        r.body = body;
        return r;
    }

    std::string dir;
    MessageStore * store;
    AccountDirectory * accounts;
    DeliveryHub * hub;
    NiceMock<MockRelayClient> * relay;
    LocalAttachmentStore * attachments;
    IngestionAdapter * adapter;
    std::shared_ptr<Account> alice;
};

TEST_F(IngestionAdapterTest, ParsesSubmissionJSON) {
    auto r = SendRequest::fromJSON({
        {"to", " bob@localhost "},
        {"subject", "Hi"},
        {"body", "<b>Hello</b>"},
        {"is_html", true},
        {"thread_id", "t-1"},
        {"parent_id", 7},
        {"attachments", {{{"filename", "a.txt"}, {"content_type", "text/plain"}, {"data", MailUtils::toBase64("hello")}}}},
    });
    EXPECT_EQ(r.to, "bob@localhost");
    EXPECT_EQ(r.subject, "Hi");
    EXPECT_TRUE(r.isRich);
    EXPECT_EQ(r.threadId, "t-1");
    EXPECT_EQ(r.parentId, 7);
    ASSERT_EQ(r.attachments.size(), 1u);
    EXPECT_EQ(r.attachments[0].data, "hello");
    EXPECT_EQ(r.attachments[0].contentType, "text/plain");
}

TEST_F(IngestionAdapterTest, RejectsMalformedSubmissionJSON) {
    EXPECT_THROW(SendRequest::fromJSON(nlohmann::json::array()), MailException);
    EXPECT_THROW(SendRequest::fromJSON({{"to", 12}}), MailException);
    EXPECT_THROW(SendRequest::fromJSON({
        {"to", "bob@localhost"},
        {"attachments", {{{"filename", "a.txt"}, {"data", "***not base64***"}}}},
    }), MailException);
}

TEST_F(IngestionAdapterTest, ValidationFailures) {
    auto missingTo = adapter->send(*store, *alice, request("", "Hi", "Body"));
    EXPECT_FALSE(missingTo.success);
    EXPECT_EQ(missingTo.status, 400);
    EXPECT_EQ(missingTo.error, "missing_recipient");

    auto missingSubject = adapter->send(*store, *alice, request("bob@localhost", "", "Body"));
    EXPECT_EQ(missingSubject.status, 400);
    EXPECT_EQ(missingSubject.error, "missing_subject");

    auto invalid = adapter->send(*store, *alice, request("bob at localhost", "Hi", "Body"));
    EXPECT_EQ(invalid.status, 400);
    EXPECT_EQ(invalid.error, "invalid_email");

    auto json = invalid.toJSON();
    EXPECT_EQ(json["success"], false);
    EXPECT_EQ(json["error"], "invalid_email");

    EXPECT_EQ(store->unreadCount(2), 0);
}

TEST_F(IngestionAdapterTest, ResolverOutageFailsSubmission) {
    UnavailableResolver unavailable;
    IngestionAdapter offline(&unavailable, hub, relay, attachments);
    auto result = offline.send(*store, *alice, request("bob@localhost", "Hi", "Body"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.error, "user_lookup_failed");
}

TEST_F(IngestionAdapterTest, LocalRecipientIsStoredAndNotified) {
    EXPECT_CALL(*relay, sendMessage(_, _, _, _, _)).Times(0);
    auto sink = std::make_shared<RecordingSink>();
    auto sub = hub->subscribe(2, sink);

    auto result = adapter->send(*store, *alice, request("bob@localhost", "Hi", "Body"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.stored->fromAccountId(), 1);
    EXPECT_EQ(result.stored->toAccountId(), 2);
    EXPECT_EQ(result.stored->fromAddress(), "alice@localhost");

    auto json = result.toJSON();
    EXPECT_EQ(json["success"], true);
    EXPECT_EQ(json["id"], result.stored->id());
    EXPECT_EQ(json["thread_id"], result.stored->threadId());
    EXPECT_FALSE(json.count("warnings"));

    hub->drain();
    for (int i = 0; i < 4; i++) {
        sub->deliverNext(std::chrono::milliseconds(200));
    }
    auto chunks = sink->chunks();
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_NE(chunks[2].find("\"id\":" + std::to_string(result.stored->id())), std::string::npos);
}

TEST_F(IngestionAdapterTest, ReplyJoinsParentThread) {
    auto root = adapter->send(*store, *alice, request("bob@localhost", "Hi", "Body"));
    auto bob = accounts->findByUsername("bob");

    auto reply = request("alice@localhost", "Re: Hi", "Reply");
    reply.parentId = root.stored->id();
    auto result = adapter->send(*store, *bob, reply);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stored->threadId(), root.stored->threadId());
    EXPECT_EQ(store->getThread(root.stored->threadId()).size(), 2u);
}

TEST_F(IngestionAdapterTest, UnknownLocalUserIsStoredAndHandedToRelay) {
    // The relay client treats its own host as a no-op.
    EXPECT_CALL(*relay, sendMessage("alice@localhost", "nobody@localhost", "Hi", "Body", "localhost")).Times(1);
    auto result = adapter->send(*store, *alice, request("nobody@localhost", "Hi", "Body"));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.stored->toAccountId(), 0);
    EXPECT_EQ(store->getInboxForAddress("nobody@localhost", 10, 0).size(), 1u);
}

TEST_F(IngestionAdapterTest, RemoteRecipientIsRelayed) {
    EXPECT_CALL(*relay, sendMessage("alice@localhost", "dave@remote.example", "Hi", "Body", "remote.example")).Times(1);
    auto result = adapter->send(*store, *alice, request("dave@remote.example", "Hi", "Body"));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(IngestionAdapterTest, RelayFailureBecomesWarning) {
    EXPECT_CALL(*relay, sendMessage(_, _, _, _, "remote.example"))
        .WillOnce(Throw(MailException(THREADMAIL_ERROR_RELAY, "timed out", true)));

    auto result = adapter->send(*store, *alice, request("dave@remote.example", "Hi", "Body"));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_THAT(result.warnings[0], HasSubstr("Relay to remote.example failed"));
    EXPECT_EQ(result.toJSON()["warnings"].size(), 1u);
    EXPECT_NE(store->getMessage(result.stored->id()), nullptr);
}

TEST_F(IngestionAdapterTest, AttachmentsAreStoredAndOversizedOnesSkipped) {
    auto r = request("bob@localhost", "Files", "See attached");
    r.attachments.push_back({"notes.txt", "text/plain", "hello world"});
    r.attachments.push_back({"huge.bin", "", std::string(THREADMAIL_MAX_ATTACHMENT_BYTES + 1, 'x')});

    auto result = adapter->send(*store, *alice, r);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.attachmentsTotal, 2);
    EXPECT_EQ(result.attachmentsProcessed, 1);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_THAT(result.warnings[0], HasSubstr("huge.bin"));
    EXPECT_EQ(result.stored->attachmentCount(), 1);

    auto json = result.toJSON();
    EXPECT_EQ(json["attachments"]["processed"], 1);
    EXPECT_EQ(json["attachments"]["total"], 2);

    auto saved = store->getAttachments(result.stored->id());
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0]->size(), 11);
    std::ifstream file(saved[0]->path());
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "hello world");
}

TEST_F(IngestionAdapterTest, AcceptsRelayedMessage) {
    auto sink = std::make_shared<RecordingSink>();
    auto sub = hub->subscribe(2, sink);

    auto result = adapter->acceptRelayed(*store, {
        {"from", "dave@remote.example"},
        {"to", "bob@localhost"},
        {"subject", "From afar"},
        {"body", "Hello Bob"},
        {"timestamp", "2024-01-01T00:00:00Z"},
    });
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.message, "Message relayed successfully");
    EXPECT_EQ(result.stored->fromAccountId(), 0);
    EXPECT_EQ(result.stored->toAccountId(), 2);
    EXPECT_TRUE(result.stored->isRoot());
    EXPECT_EQ(store->unreadCount(2), 1);

    hub->drain();
    for (int i = 0; i < 4; i++) {
        sub->deliverNext(std::chrono::milliseconds(200));
    }
    auto chunks = sink->chunks();
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[2].find("event: new-message\n"), 0u);
}

TEST_F(IngestionAdapterTest, RejectsBadRelayEnvelopes) {
    auto notObject = adapter->acceptRelayed(*store, nlohmann::json::array());
    EXPECT_EQ(notObject.status, 400);
    EXPECT_EQ(notObject.error, "invalid_json");

    auto badRecipient = adapter->acceptRelayed(*store, {{"from", "d@remote.example"}, {"to", "bob"}, {"subject", "x"}});
    EXPECT_EQ(badRecipient.status, 400);
    EXPECT_EQ(badRecipient.error, "invalid_recipient_format");

    auto elsewhere = adapter->acceptRelayed(*store, {{"from", "d@remote.example"}, {"to", "bob@other.example"}, {"subject", "x"}});
    EXPECT_EQ(elsewhere.status, 400);
    EXPECT_EQ(elsewhere.error, "recipient_not_on_server");

    auto unknown = adapter->acceptRelayed(*store, {{"from", "d@remote.example"}, {"to", "nobody@localhost"}, {"subject", "x"}});
    EXPECT_EQ(unknown.status, 404);
    EXPECT_EQ(unknown.error, "user_not_found");

    UnavailableResolver unavailable;
    IngestionAdapter offline(&unavailable, hub, relay, attachments);
    auto lookup = offline.acceptRelayed(*store, {{"from", "d@remote.example"}, {"to", "bob@localhost"}, {"subject", "x"}});
    EXPECT_EQ(lookup.status, 500);
    EXPECT_EQ(lookup.error, "user_lookup_failed");

    EXPECT_EQ(store->unreadCount(2), 0);
}
