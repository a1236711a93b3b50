#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "threadmail/identity_resolver.hpp"
#include "threadmail/mail_exception.hpp"

#include <fstream>

using namespace std;

class IdentityResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnsureTestLogger();
        dir = MakeTestDir("identity");
    }

    void TearDown() override {
        RemoveTestDir(dir);
    }

    void writeFile(string name, string contents) {
        ofstream out(dir + "/" + name);
        out << contents;
    }

    string dir;
};

TEST_F(IdentityResolverTest, SeedsDevelopmentAccountsWhenMissing) {
    AccountDirectory directory(dir + "/accounts.json", "localhost", true);
    EXPECT_EQ(directory.size(), 3u);

    auto alice = directory.authenticate("alice", "password123");
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->id(), 1);
    EXPECT_EQ(directory.findById(2)->username(), "bob");
    EXPECT_EQ(directory.authenticate("alice", "wrong"), nullptr);
    EXPECT_EQ(directory.authenticate("mallory", "password123"), nullptr);

    // The seeded file is read back by the next instance.
    AccountDirectory reloaded(dir + "/accounts.json", "localhost", false);
    EXPECT_EQ(reloaded.size(), 3u);
    EXPECT_NE(reloaded.authenticate("charlie", "password789"), nullptr);
}

TEST_F(IdentityResolverTest, MissingDirectoryWithoutSeedingIsLookupError) {
    try {
        AccountDirectory directory(dir + "/absent.json", "localhost", false);
        FAIL() << "Expected a lookup error";
    } catch (MailException & ex) {
        EXPECT_TRUE(ex.is(THREADMAIL_ERROR_LOOKUP));
    }
}

TEST_F(IdentityResolverTest, InvalidFilesAreLookupErrors) {
    writeFile("broken.json", "{not json");
    EXPECT_THROW(AccountDirectory(dir + "/broken.json", "localhost", false), MailException);

    writeFile("object.json", "{\"alice\": 1}");
    EXPECT_THROW(AccountDirectory(dir + "/object.json", "localhost", false), MailException);
}

TEST_F(IdentityResolverTest, SkipsInvalidEntries) {
    writeFile("accounts.json", R"([
        {"id": 7, "username": "erin", "password": "pw"},
        {"id": 0, "username": "zero", "password": "pw"},
        {"id": 8, "password": "pw"},
        {"id": 9, "username": "nopass"}
    ])");
    AccountDirectory directory(dir + "/accounts.json", "mail.local", false);
    EXPECT_EQ(directory.size(), 1u);
    EXPECT_NE(directory.findByUsername("erin"), nullptr);
    EXPECT_EQ(directory.findByUsername("zero"), nullptr);
    EXPECT_EQ(directory.findById(9), nullptr);
}

TEST_F(IdentityResolverTest, ResolvesAddresses) {
    AccountDirectory directory(dir + "/accounts.json", "Mail.Local", true);

    auto bob = directory.resolveAddress("bob@mail.local");
    ASSERT_NE(bob, nullptr);
    EXPECT_EQ(bob->username(), "bob");

    EXPECT_EQ(directory.resolveAddress("nobody@mail.local"), nullptr);
    EXPECT_EQ(directory.resolveAddress("bob@remote.example"), nullptr);
    EXPECT_THROW(directory.resolveAddress("not-an-address"), MailException);

    EXPECT_TRUE(directory.isLocalDomain("MAIL.local"));
    EXPECT_FALSE(directory.isLocalDomain("remote.example"));
    EXPECT_EQ(directory.addressFor(*bob), "bob@Mail.Local");
    EXPECT_EQ(directory.serverHost(), "Mail.Local");
}

TEST_F(IdentityResolverTest, AccountJSONOmitsPassword) {
    AccountDirectory directory(dir + "/accounts.json", "localhost", true);
    auto json = directory.findByUsername("alice")->toJSON();
    EXPECT_EQ(json["username"], "alice");
    EXPECT_FALSE(json.count("password"));
}
