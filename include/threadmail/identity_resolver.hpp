/** IdentityResolver [Threadmail]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef IdentityResolver_hpp
#define IdentityResolver_hpp

#include <stdint.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "nlohmann/json.hpp"

#include "threadmail/models/account.hpp"

/**
 Answers "who is this?" for every ingress path. Implementations must be
 safe to call from many session and request threads at once, and report
 backend failures by throwing MailException("lookup-error").
 */
class IdentityResolver {
protected:
    std::string _serverHost;

public:
    IdentityResolver(std::string serverHost);
    virtual ~IdentityResolver() {}

    // Returns nullptr when the credentials do not match an account.
    virtual std::shared_ptr<Account> authenticate(std::string username, std::string password) = 0;

    virtual std::shared_ptr<Account> findByUsername(std::string username) = 0;

    virtual std::shared_ptr<Account> findById(int64_t id) = 0;

    // Returns the local account an address delivers to, or nullptr when the
    // address belongs to another server or to no account on this one.
    std::shared_ptr<Account> resolveAddress(std::string address);

    bool isLocalDomain(std::string domain);

    std::string addressFor(Account & account);

    std::string serverHost();
};

/**
 Development account directory backed by a JSON file:
 [{"id": 1, "username": "alice", "password": "...", "emailAddress": "..."}]
 */
class AccountDirectory : public IdentityResolver {
    std::mutex _mtx;
    std::string _path;
    std::map<std::string, std::shared_ptr<Account>> _byUsername;

    void load();
    void seedDevelopmentAccounts();
    void persist();

public:
    AccountDirectory(std::string path, std::string serverHost, bool seedIfMissing);

    std::shared_ptr<Account> authenticate(std::string username, std::string password);

    std::shared_ptr<Account> findByUsername(std::string username);

    std::shared_ptr<Account> findById(int64_t id);

    size_t size();
};

#endif /* IdentityResolver_hpp */
