/** MessageStore [Threadmail]
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

#ifndef MessageStore_hpp
#define MessageStore_hpp

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <map>
#include <memory>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

#include "threadmail/models/message.hpp"
#include "threadmail/models/attachment.hpp"
#include "threadmail/query.hpp"
#include "threadmail/mail_exception.hpp"

/**
 Fields supplied to MessageStore::createMessage. Zero account and parent
 ids and an empty threadId mean "absent".
 */
struct MessageDraft {
    int64_t fromAccountId = 0;
    int64_t toAccountId = 0;
    std::string fromAddress;
    std::string toAddress;
    std::string subject;
    std::string body;
    bool isRich = false;
    std::string threadId;
    int64_t parentId = 0;
    int64_t createdAt = 0;
};

/**
 The thread store. Every thread that touches the database opens its own
 MessageStore; SQLite (WAL, immediate write transactions) serializes the
 writers between them.
 */
class MessageStore {
    SQLite::Database _db;
    SQLite::Statement _stmtBeginTransaction;
    SQLite::Statement _stmtBeginReadTransaction;
    SQLite::Statement _stmtRollbackTransaction;
    SQLite::Statement _stmtCommitTransaction;

    bool _transactionOpen;

    std::map<std::string, std::shared_ptr<SQLite::Statement>> _saveUpdateQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _saveInsertQueries;

public:
    MessageStore(std::string path);

    void migrate();

    SQLite::Database & db();

    void beginTransaction(bool readOnly = false);

    void rollbackTransaction();

    void commitTransaction();

    bool transactionOpen();

    void save(MailModel * model);

    // Thread store operations

    std::shared_ptr<Message> createMessage(const MessageDraft & draft);

    std::shared_ptr<Message> getMessage(int64_t id);

    std::vector<std::shared_ptr<Message>> getThread(std::string threadId);

    std::vector<std::shared_ptr<Message>> getInboxRoots(int64_t accountId, int limit, int offset);

    std::vector<std::shared_ptr<Message>> getSent(int64_t accountId, int limit, int offset);

    std::vector<std::shared_ptr<Message>> getInboxForAddress(std::string address, int limit, int offset);

    bool markRead(int64_t id);

    int64_t unreadCount(int64_t accountId);

    std::vector<std::shared_ptr<Attachment>> getAttachments(int64_t messageId);

    std::shared_ptr<Attachment> getAttachment(int64_t id);

    // Find - Template methods which must be defined in header file

    template<typename ModelClass>
    std::shared_ptr<ModelClass> find(Query & query) {
        SQLite::Statement statement(this->_db, ModelClass::SELECT_SQL + query.getSQL() + (query.getLimit() ? "" : " LIMIT 1"));
        query.bind(statement);
        if (statement.executeStep()) {
            return std::make_shared<ModelClass>(statement);
        }
        return nullptr;
    }

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findAll(Query & query) {
        SQLite::Statement statement(this->_db, ModelClass::SELECT_SQL + query.getSQL());
        query.bind(statement);

        std::vector<std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results.push_back(std::make_shared<ModelClass>(statement));
        }

        return results;
    }

private:
    MailException persistenceError(const SQLite::Exception & ex, const char * operation);
};


#endif /* MessageStore_hpp */
