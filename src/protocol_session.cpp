#include "threadmail/protocol_session.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"

#include <sstream>

#include "spdlog/spdlog.h"

using namespace std;

const vector<ComposeTransition> ProtocolSession::TRANSITIONS = {
    {ComposeState::Empty,         ComposeCommand::Send,    ComposeState::HaveRecipient},
    {ComposeState::HaveRecipient, ComposeCommand::Send,    ComposeState::HaveRecipient},
    {ComposeState::HaveSubject,   ComposeCommand::Send,    ComposeState::HaveSubject},
    {ComposeState::HaveRecipient, ComposeCommand::Subject, ComposeState::HaveSubject},
    {ComposeState::HaveSubject,   ComposeCommand::Subject, ComposeState::HaveSubject},
    {ComposeState::HaveSubject,   ComposeCommand::Body,    ComposeState::Empty},
};

bool ProtocolSession::nextComposeState(ComposeState from, ComposeCommand command, ComposeState & to) {
    for (const auto & t : TRANSITIONS) {
        if (t.from == from && t.command == command) {
            to = t.to;
            return true;
        }
    }
    return false;
}

ProtocolSession::ProtocolSession(shared_ptr<LineConnection> conn, MessageStore * store, IdentityResolver * resolver, IngestionAdapter * ingestion) :
    _conn(conn), _store(store), _resolver(resolver), _ingestion(ingestion), _account(nullptr), _state(ComposeState::Empty)
{
}

bool ProtocolSession::isAuthenticated() {
    return _account != nullptr;
}

ComposeState ProtocolSession::composeState() {
    return _state;
}

void ProtocolSession::reply(const string & line) {
    if (!_conn->writeLine(line)) {
        spdlog::get("logger")->debug("[{}] write failed", _conn->peerName());
    }
}

void ProtocolSession::run() {
    auto logger = spdlog::get("logger");
    string peer = _conn->peerName();
    logger->info("New line connection from {}", peer);

    reply("220 " + _resolver->serverHost() + " Threadmail ready");

    string line;
    try {
        while (_conn->readLine(line)) {
            if (!handleLine(line)) {
                break;
            }
        }
    } catch (GenericException & ex) {
        logger->error("[{}] session ended with error: {}", peer, MailUtils::dumpJSON(ex.toJSON()));
    } catch (std::exception & ex) {
        logger->error("[{}] session ended with error: {}", peer, ex.what());
    }

    _conn->close();
    logger->info("Line connection from {} closed", peer);
}

bool ProtocolSession::handleLine(const string & rawLine) {
    string line = MailUtils::trim(rawLine);
    if (line == "") {
        return true;
    }

    size_t space = line.find(' ');
    string command = MailUtils::toUpper(line.substr(0, space));
    string args = space == string::npos ? "" : MailUtils::trim(line.substr(space + 1));

    spdlog::get("logger")->debug("[{}] Command: {}", _conn->peerName(), command == "CONNECT" ? "CONNECT ***" : line);

    if (command == "CONNECT") {
        handleConnect(args);
    } else if (command == "SEND") {
        handleSend(args);
    } else if (command == "SUBJECT") {
        handleSubject(args);
    } else if (command == "BODY") {
        handleBody(args);
    } else if (command == "LIST") {
        handleList();
    } else if (command == "READ") {
        handleRead(args);
    } else if (command == "HELP") {
        handleHelp();
    } else if (command == "QUIT") {
        handleQuit();
        return false;
    } else {
        reply("500 Unknown command: " + command);
    }
    return true;
}

bool ProtocolSession::requireAuthenticated() {
    if (_account == nullptr) {
        reply("530 Not authenticated");
        return false;
    }
    return true;
}

void ProtocolSession::handleConnect(const string & args) {
    size_t space = args.find(' ');
    if (args == "" || space == string::npos) {
        reply("501 Usage: CONNECT <username> <password>");
        return;
    }
    string username = args.substr(0, space);
    string password = args.substr(space + 1);

    shared_ptr<Account> account = nullptr;
    try {
        account = _resolver->authenticate(username, password);
    } catch (MailException & ex) {
        spdlog::get("logger")->error("Authentication lookup failed for {}: {}", username, ex.what());
        reply("454 Temporary authentication failure");
        return;
    }
    if (account == nullptr) {
        reply("535 Authentication failed");
        return;
    }

    _account = account;
    reply("250 Hello " + username + ", authenticated successfully");
    spdlog::get("logger")->info("User {} authenticated on {}", username, _conn->peerName());
}

void ProtocolSession::handleSend(const string & args) {
    if (!requireAuthenticated()) {
        return;
    }
    if (args == "") {
        reply("501 Usage: SEND <recipient@host>");
        return;
    }
    if (!MailUtils::isValidAddress(args)) {
        reply("501 Invalid address: " + args);
        return;
    }
    ComposeState next;
    if (!nextComposeState(_state, ComposeCommand::Send, next)) {
        reply("503 Bad sequence of commands");
        return;
    }
    _state = next;
    _pendingRecipient = args;
    reply("250 Recipient set to " + args);
}

void ProtocolSession::handleSubject(const string & args) {
    if (!requireAuthenticated()) {
        return;
    }
    ComposeState next;
    if (!nextComposeState(_state, ComposeCommand::Subject, next)) {
        reply("503 Use SEND command first");
        return;
    }
    if (args == "") {
        reply("501 Usage: SUBJECT <text>");
        return;
    }
    _state = next;
    _pendingSubject = args;
    reply("250 Subject set");
}

void ProtocolSession::handleBody(const string & args) {
    if (!requireAuthenticated()) {
        return;
    }
    ComposeState next;
    if (!nextComposeState(_state, ComposeCommand::Body, next)) {
        reply("503 Use SEND and SUBJECT commands first");
        return;
    }

    SendRequest request;
    request.to = _pendingRecipient;
    request.subject = _pendingSubject;
    request.body = args;

    // The compose state is cleared whether or not the submission succeeds.
    _state = next;
    _pendingRecipient = "";
    _pendingSubject = "";

    SendResult result = _ingestion->send(*_store, *_account, request);
    if (!result.success) {
        spdlog::get("logger")->error("Session submission to {} failed: {} {}", request.to, result.error, result.message);
        reply("550 Failed to send message");
        return;
    }
    for (const auto & warning : result.warnings) {
        spdlog::get("logger")->warn("Message {}: {}", result.stored->id(), warning);
    }
    reply("250 " + to_string(result.stored->id()) + " Message sent successfully");
}

void ProtocolSession::handleList() {
    if (!requireAuthenticated()) {
        return;
    }
    vector<shared_ptr<Message>> messages;
    try {
        messages = _store->getInboxRoots(_account->id(), THREADMAIL_LIST_LIMIT, 0);
    } catch (MailException & ex) {
        spdlog::get("logger")->error("Inbox listing for {} failed: {}", _account->username(), ex.what());
        reply("550 Failed to retrieve messages");
        return;
    }

    reply("250 " + to_string(messages.size()) + " messages");
    int index = 1;
    for (auto & msg : messages) {
        ostringstream summary;
        summary << index++ << ". From: " << msg->fromAddress()
                << " | Subject: " << msg->subject()
                << " | " << (msg->isRead() ? "read" : "unread")
                << " | " << MailUtils::formatTimestamp(msg->createdAt(), "%Y-%m-%d %H:%M");
        reply(summary.str());
    }
}

void ProtocolSession::handleRead(const string & args) {
    if (!requireAuthenticated()) {
        return;
    }
    if (args == "") {
        reply("501 Usage: READ <message_number>");
        return;
    }

    vector<shared_ptr<Message>> messages;
    try {
        messages = _store->getInboxRoots(_account->id(), THREADMAIL_LIST_LIMIT, 0);
    } catch (MailException & ex) {
        spdlog::get("logger")->error("Inbox listing for {} failed: {}", _account->username(), ex.what());
        reply("550 Failed to retrieve messages");
        return;
    }

    size_t consumed = 0;
    long index = 0;
    try {
        index = stol(args, &consumed);
    } catch (std::logic_error &) {
        consumed = 0;
    }
    if (consumed != args.size() || index < 1 || index > (long)messages.size()) {
        reply("501 Invalid message number");
        return;
    }

    auto msg = messages[index - 1];
    try {
        _store->markRead(msg->id());
    } catch (MailException & ex) {
        spdlog::get("logger")->warn("Could not mark message {} read: {}", msg->id(), ex.what());
    }

    reply("250 Message content:");
    reply("From: " + msg->fromAddress());
    reply("To: " + msg->toAddress());
    reply("Subject: " + msg->subject());
    reply("Date: " + MailUtils::formatTimestamp(msg->createdAt(), "%Y-%m-%d %H:%M:%S"));
    reply("");

    istringstream body(msg->body());
    string bodyLine;
    while (getline(body, bodyLine)) {
        if (bodyLine.size() > 0 && bodyLine.back() == '\r') {
            bodyLine.pop_back();
        }
        if (bodyLine.size() > 0 && bodyLine[0] == '.') {
            bodyLine = "." + bodyLine;
        }
        reply(bodyLine);
    }
    reply(".");
}

void ProtocolSession::handleHelp() {
    reply("214 Available commands:");
    reply("  CONNECT <username> <password> - Authenticate");
    reply("  SEND <recipient@host> - Set recipient");
    reply("  SUBJECT <subject> - Set message subject");
    reply("  BODY <body> - Set message body and send");
    reply("  LIST - Show inbox");
    reply("  READ <number> - Read specific message");
    reply("  HELP - Show this help");
    reply("  QUIT - Close connection");
}

void ProtocolSession::handleQuit() {
    reply("221 Goodbye");
}
