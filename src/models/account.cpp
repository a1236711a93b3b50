#include "threadmail/models/account.hpp"

std::string Account::TABLE_NAME = "Account";

Account::Account(nlohmann::json json) : MailModel(json) {

}

std::string Account::valid() {
    if (!_data.count("id") || !_data["id"].is_number_integer() || id() <= 0) {
        return "id";
    }
    if (!_data.count("username") || !_data["username"].is_string() || username() == "") {
        return "username";
    }
    if (!_data.count("password") || !_data["password"].is_string()) {
        return "password";
    }
    return ""; // true
}

std::string Account::username() {
    return _data["username"].get<std::string>();
}

std::string Account::emailAddress() {
    if (!_data.count("emailAddress") || !_data["emailAddress"].is_string()) {
        return "";
    }
    return _data["emailAddress"].get<std::string>();
}

std::string Account::password() {
    return _data["password"].get<std::string>();
}

std::string Account::tableName() {
    return Account::TABLE_NAME;
}

std::vector<std::string> Account::columnsForQuery() {
    return std::vector<std::string>{"id", "username", "emailAddress"};
}

nlohmann::json Account::toJSON() {
    nlohmann::json j = MailModel::toJSON();
    j.erase("password");
    return j;
}
