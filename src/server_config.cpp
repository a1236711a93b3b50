#include "threadmail/server_config.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"

#include <fstream>
#include <sstream>

using namespace std;
using namespace nlohmann;

// setting name => environment variable
static const vector<pair<string, string>> ENVIRONMENT_KEYS = {
    {"tcpPort", "TCP_PORT"},
    {"httpPort", "HTTP_PORT"},
    {"serverHost", "SERVER_HOST"},
    {"configDirPath", "CONFIG_DIR_PATH"},
    {"databasePath", "DATABASE_PATH"},
    {"accountsPath", "ACCOUNTS_PATH"},
    {"attachmentsPath", "ATTACHMENTS_PATH"},
    {"relayPort", "RELAY_PORT"},
    {"relayTimeout", "RELAY_TIMEOUT"},
    {"keepaliveInterval", "KEEPALIVE_INTERVAL"},
    {"dispatchThreads", "DISPATCH_THREADS"},
    {"environment", "ENVIRONMENT"},
};

ServerConfig::ServerConfig() : _data(ServerConfig::defaults()) {
}

json ServerConfig::defaults() {
    return {
        {"tcpPort", 7777},
        {"httpPort", 8080},
        {"serverHost", "localhost"},
        {"configDirPath", "./data"},
        {"databasePath", ""},
        {"accountsPath", ""},
        {"attachmentsPath", ""},
        {"relayPort", 8080},
        {"relayTimeout", 10},
        {"keepaliveInterval", 30},
        {"dispatchThreads", 2},
        {"environment", "development"},
    };
}

void ServerConfig::mergeFile(string path) {
    ifstream in(path);
    if (!in) {
        throw MailException(THREADMAIL_ERROR_VALIDATION, "Could not open config file " + path);
    }
    stringstream contents;
    contents << in.rdbuf();
    json overrides = json::parse(contents.str(), nullptr, false);
    if (!overrides.is_object()) {
        throw MailException(THREADMAIL_ERROR_VALIDATION, "Config file " + path + " is not a JSON object");
    }
    mergeJSON(overrides);
}

void ServerConfig::mergeEnvironment() {
    json defaultValues = ServerConfig::defaults();
    json overrides = json::object();

    for (auto & entry : ENVIRONMENT_KEYS) {
        string val = MailUtils::getEnvUTF8(entry.second);
        if (val == "") {
            continue;
        }
        if (defaultValues[entry.first].is_number_integer()) {
            try {
                size_t consumed = 0;
                int n = stoi(val, &consumed);
                overrides[entry.first] = consumed == val.size() ? json(n) : json(val);
            } catch (std::exception &) {
                // left as a string so valid() names it
                overrides[entry.first] = val;
            }
        } else {
            overrides[entry.first] = val;
        }
    }
    mergeJSON(overrides);
}

void ServerConfig::mergeJSON(const json & overrides) {
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        _data[it.key()] = it.value();
    }
}

vector<string> ServerConfig::valid() {
    vector<string> problems;

    for (auto key : {"tcpPort", "httpPort", "relayPort"}) {
        if (!_data[key].is_number_integer() || _data[key].get<int>() < 0 || _data[key].get<int>() > 65535) {
            problems.push_back(key);
        }
    }
    for (auto key : {"relayTimeout", "keepaliveInterval", "dispatchThreads"}) {
        if (!_data[key].is_number_integer() || _data[key].get<int>() < 1) {
            problems.push_back(key);
        }
    }
    for (auto key : {"serverHost", "configDirPath", "environment"}) {
        if (!_data[key].is_string() || _data[key].get<string>() == "") {
            problems.push_back(key);
        }
    }
    for (auto key : {"databasePath", "accountsPath", "attachmentsPath"}) {
        if (!_data[key].is_string()) {
            problems.push_back(key);
        }
    }
    return problems;
}

int ServerConfig::intValue(const char * key) {
    if (!_data[key].is_number_integer()) {
        return ServerConfig::defaults()[key].get<int>();
    }
    return _data[key].get<int>();
}

string ServerConfig::stringValue(const char * key) {
    if (!_data[key].is_string()) {
        return "";
    }
    return _data[key].get<string>();
}

int ServerConfig::tcpPort() {
    return intValue("tcpPort");
}

int ServerConfig::httpPort() {
    return intValue("httpPort");
}

string ServerConfig::serverHost() {
    return stringValue("serverHost");
}

string ServerConfig::configDirPath() {
    return stringValue("configDirPath");
}

string ServerConfig::databasePath() {
    string path = stringValue("databasePath");
    return path != "" ? path : configDirPath() + FS_PATH_SEP + "threadmail.db";
}

string ServerConfig::accountsPath() {
    string path = stringValue("accountsPath");
    return path != "" ? path : configDirPath() + FS_PATH_SEP + "accounts.json";
}

string ServerConfig::attachmentsPath() {
    string path = stringValue("attachmentsPath");
    return path != "" ? path : configDirPath() + FS_PATH_SEP + "attachments";
}

string ServerConfig::logPath() {
    return configDirPath() + FS_PATH_SEP + "threadmail.log";
}

int ServerConfig::relayPort() {
    return intValue("relayPort");
}

int ServerConfig::relayTimeout() {
    return intValue("relayTimeout");
}

int ServerConfig::keepaliveInterval() {
    return intValue("keepaliveInterval");
}

int ServerConfig::dispatchThreads() {
    return intValue("dispatchThreads");
}

string ServerConfig::environment() {
    return stringValue("environment");
}

bool ServerConfig::isDevelopment() {
    return environment() == "development";
}

json ServerConfig::toJSON() {
    json j = _data;
    j["databasePath"] = databasePath();
    j["accountsPath"] = accountsPath();
    j["attachmentsPath"] = attachmentsPath();
    return j;
}
