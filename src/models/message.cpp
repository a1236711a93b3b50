#include "threadmail/models/message.hpp"
#include "threadmail/mail_utils.hpp"

std::string Message::TABLE_NAME = "Message";

std::string Message::SELECT_SQL = "SELECT Message.*, "
    "(SELECT COUNT(*) FROM Attachment WHERE Attachment.messageId = Message.id) AS attachmentCount "
    "FROM Message";

Message::Message(nlohmann::json json) : MailModel(json) {
    if (!_data.count("isRich")) {
        _data["isRich"] = false;
    }
    if (!_data.count("isRead")) {
        _data["isRead"] = false;
    }
}

Message::Message(SQLite::Statement & query) :
    MailModel(query)
{
}

int64_t Message::fromAccountId() {
    return optionalInt64("fromAccountId");
}

int64_t Message::toAccountId() {
    return optionalInt64("toAccountId");
}

std::string Message::fromAddress() {
    return _data["fromAddress"].get<std::string>();
}

std::string Message::toAddress() {
    return _data["toAddress"].get<std::string>();
}

std::string Message::subject() {
    return _data["subject"].get<std::string>();
}

std::string Message::body() {
    return _data["body"].get<std::string>();
}

// SQLite hands booleans back as integers
bool Message::isRich() {
    nlohmann::json & v = _data["isRich"];
    return v.is_boolean() ? v.get<bool>() : (v.is_number() && v.get<int64_t>() != 0);
}

std::string Message::threadId() {
    return _data["threadId"].get<std::string>();
}

int64_t Message::parentId() {
    return optionalInt64("parentId");
}

bool Message::isRead() {
    nlohmann::json & v = _data["isRead"];
    return v.is_boolean() ? v.get<bool>() : (v.is_number() && v.get<int64_t>() != 0);
}

int64_t Message::createdAt() {
    return optionalInt64("createdAt");
}

int Message::attachmentCount() {
    return (int)optionalInt64("attachmentCount");
}

bool Message::isRoot() {
    return parentId() == 0;
}

bool Message::isAddressedTo(int64_t accountId) {
    return accountId != 0 && toAccountId() == accountId;
}

bool Message::involves(int64_t accountId) {
    return accountId != 0 && (toAccountId() == accountId || fromAccountId() == accountId);
}

std::vector<std::shared_ptr<Message>> & Message::replies() {
    return _replies;
}

void Message::setReplies(std::vector<std::shared_ptr<Message>> replies) {
    _replies = replies;
}

std::string Message::tableName() {
    return Message::TABLE_NAME;
}

std::vector<std::string> Message::columnsForQuery() {
    return std::vector<std::string>{"id", "fromAccountId", "toAccountId", "fromAddress", "toAddress", "subject", "body", "isRich", "threadId", "parentId", "isRead", "createdAt"};
}

nlohmann::json Message::toJSONDispatch() {
    nlohmann::json j = {
        {"id", id()},
        {"from", fromAddress()},
        {"to", toAddress()},
        {"subject", subject()},
        {"body", body()},
        {"isRich", isRich()},
        {"threadId", threadId()},
        {"read", isRead()},
        {"timestamp", MailUtils::timestampForTime(createdAt())},
    };
    if (parentId() != 0) {
        j["parentId"] = parentId();
    }
    if (attachmentCount() > 0) {
        j["attachmentCount"] = attachmentCount();
    }
    if (_replies.size() > 0) {
        nlohmann::json replies = nlohmann::json::array();
        for (auto & reply : _replies) {
            replies.push_back(reply->toJSONDispatch());
        }
        j["replies"] = replies;
    }
    return j;
}
