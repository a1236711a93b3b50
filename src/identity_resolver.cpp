#include "threadmail/identity_resolver.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"

#include <fstream>
#include <utility>
#include <vector>

#include "spdlog/spdlog.h"

using namespace std;

IdentityResolver::IdentityResolver(string serverHost) :
    _serverHost(serverHost)
{
}

shared_ptr<Account> IdentityResolver::resolveAddress(string address) {
    if (!MailUtils::isValidAddress(address)) {
        throw MailException(THREADMAIL_ERROR_VALIDATION, "Invalid email format: " + address);
    }
    AddressParts parts = MailUtils::splitAddress(address);
    if (!isLocalDomain(parts.domain)) {
        return nullptr;
    }
    auto account = findByUsername(parts.local);
    if (account == nullptr) {
        spdlog::get("logger")->info("Local user {} not found, treating {} as external", parts.local, address);
    }
    return account;
}

bool IdentityResolver::isLocalDomain(string domain) {
    return MailUtils::toUpper(domain) == MailUtils::toUpper(_serverHost);
}

string IdentityResolver::addressFor(Account & account) {
    return account.username() + "@" + _serverHost;
}

string IdentityResolver::serverHost() {
    return _serverHost;
}

#pragma mark AccountDirectory

AccountDirectory::AccountDirectory(string path, string serverHost, bool seedIfMissing) :
    IdentityResolver(serverHost), _path(path)
{
    ifstream probe(_path);
    if (probe.good()) {
        probe.close();
        load();
    } else if (seedIfMissing) {
        seedDevelopmentAccounts();
    } else {
        throw MailException(THREADMAIL_ERROR_LOOKUP, "Account directory not found at " + _path);
    }
}

void AccountDirectory::load() {
    ifstream in(_path);
    nlohmann::json list;
    try {
        in >> list;
    } catch (nlohmann::json::exception & ex) {
        throw MailException(THREADMAIL_ERROR_LOOKUP, "Account directory at " + _path + " is not valid JSON: " + ex.what());
    }
    if (!list.is_array()) {
        throw MailException(THREADMAIL_ERROR_LOOKUP, "Account directory at " + _path + " must contain an array");
    }

    for (const auto & item : list) {
        auto account = make_shared<Account>(item);
        string invalid = account->valid();
        if (invalid != "") {
            spdlog::get("logger")->warn("Skipping account entry with invalid {}: {}", invalid, MailUtils::dumpJSON(account->toJSON()));
            continue;
        }
        _byUsername[account->username()] = account;
    }
    spdlog::get("logger")->info("Loaded {} accounts from {}", _byUsername.size(), _path);
}

void AccountDirectory::seedDevelopmentAccounts() {
    vector<pair<string, string>> seeds = {
        {"alice", "password123"},
        {"bob", "password456"},
        {"charlie", "password789"},
    };
    int64_t id = 1;
    for (auto & seed : seeds) {
        _byUsername[seed.first] = make_shared<Account>(nlohmann::json({
            {"id", id++},
            {"username", seed.first},
            {"password", seed.second},
            {"emailAddress", seed.first + "@" + _serverHost},
        }));
    }
    spdlog::get("logger")->info("Seeded {} development accounts", _byUsername.size());
    persist();
}

void AccountDirectory::persist() {
    nlohmann::json list = nlohmann::json::array();
    for (auto & entry : _byUsername) {
        list.push_back(entry.second->_data);
    }
    ofstream out(_path);
    if (!out.good()) {
        spdlog::get("logger")->warn("Could not write account directory to {}", _path);
        return;
    }
    out << MailUtils::dumpJSON(list, 2);
}

shared_ptr<Account> AccountDirectory::authenticate(string username, string password) {
    lock_guard<mutex> lock(_mtx);
    auto it = _byUsername.find(username);
    if (it == _byUsername.end() || it->second->password() != password) {
        return nullptr;
    }
    return it->second;
}

shared_ptr<Account> AccountDirectory::findByUsername(string username) {
    lock_guard<mutex> lock(_mtx);
    auto it = _byUsername.find(username);
    if (it == _byUsername.end()) {
        return nullptr;
    }
    return it->second;
}

shared_ptr<Account> AccountDirectory::findById(int64_t id) {
    lock_guard<mutex> lock(_mtx);
    for (auto & entry : _byUsername) {
        if (entry.second->id() == id) {
            return entry.second;
        }
    }
    return nullptr;
}

size_t AccountDirectory::size() {
    lock_guard<mutex> lock(_mtx);
    return _byUsername.size();
}
