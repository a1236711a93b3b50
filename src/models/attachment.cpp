#include <regex>

#include "threadmail/models/attachment.hpp"
#include "threadmail/mail_utils.hpp"

std::string Attachment::TABLE_NAME = "Attachment";

std::string Attachment::SELECT_SQL = "SELECT * FROM Attachment";

Attachment::Attachment(int64_t messageId, std::string filename, std::string contentType, int64_t size, std::string path) :
    MailModel(nlohmann::json::object())
{
    _data["messageId"] = messageId;
    _data["filename"] = filename;
    _data["contentType"] = contentType == "" ? "application/octet-stream" : contentType;
    _data["size"] = size;
    _data["path"] = path;
    _data["createdAt"] = MailUtils::nowMilliseconds();
}

Attachment::Attachment(nlohmann::json json) : MailModel(json) {

}

Attachment::Attachment(SQLite::Statement & query) :
    MailModel(query)
{
}

int64_t Attachment::messageId() {
    return optionalInt64("messageId");
}

std::string Attachment::filename() {
    return _data["filename"].get<std::string>();
}

std::string Attachment::safeFilename() {
    std::regex e ("[\\/:|?*><\"#]");
    std::string name = std::regex_replace(filename(), e, "-");
    if (name == "" || name == "." || name == "..") {
        return "unnamed";
    }
    return name;
}

std::string Attachment::contentType() {
    return _data["contentType"].get<std::string>();
}

int64_t Attachment::size() {
    return optionalInt64("size");
}

std::string Attachment::path() {
    return _data["path"].get<std::string>();
}

std::string Attachment::tableName() {
    return Attachment::TABLE_NAME;
}

std::vector<std::string> Attachment::columnsForQuery() {
    return std::vector<std::string>{"id", "messageId", "filename", "contentType", "size", "path", "createdAt"};
}
