#include "threadmail/message_store.hpp"
#include "threadmail/message_store_transaction.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_utils.hpp"

#include "spdlog/spdlog.h"

using namespace std;

MessageStore::MessageStore(string path) :
    _db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
    _stmtBeginTransaction(_db, "BEGIN IMMEDIATE TRANSACTION"),
    _stmtBeginReadTransaction(_db, "BEGIN DEFERRED TRANSACTION"),
    _stmtRollbackTransaction(_db, "ROLLBACK"),
    _stmtCommitTransaction(_db, "COMMIT"),
    _transactionOpen(false)
{
    _db.setBusyTimeout(10 * 1000);

    // Note: These are properties of the connection, so they must be set regardless
    // of whether the database setup queries are run.
    SQLite::Statement(_db, "PRAGMA journal_mode = WAL").executeStep();
    SQLite::Statement(_db, "PRAGMA main.cache_size = 10000").exec();
    SQLite::Statement(_db, "PRAGMA main.synchronous = NORMAL").exec();
}

void MessageStore::migrate() {
    SQLite::Statement uv(_db, "PRAGMA user_version");
    uv.executeStep();
    int version = uv.getColumn(0).getInt();

    if (version == 0) {
        spdlog::get("logger")->info("Creating database schema");
        for (string sql : SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
    }

    SQLite::Statement(_db, "PRAGMA user_version = 1").exec();
}

SQLite::Database & MessageStore::db()
{
    return this->_db;
}

void MessageStore::beginTransaction(bool readOnly) {
    SQLite::Statement & stmt = readOnly ? _stmtBeginReadTransaction : _stmtBeginTransaction;
    stmt.exec();
    stmt.reset();
    _transactionOpen = true;
}

void MessageStore::rollbackTransaction() {
    _saveUpdateQueries = {};
    _saveInsertQueries = {};
    _stmtRollbackTransaction.exec();
    _stmtRollbackTransaction.reset();
    _transactionOpen = false;
}

void MessageStore::commitTransaction() {
    _stmtCommitTransaction.exec();
    _stmtCommitTransaction.reset();
    _transactionOpen = false;
}

bool MessageStore::transactionOpen() {
    return _transactionOpen;
}

void MessageStore::save(MailModel * model) {
    auto tableName = model->tableName();

    if (model->isSaved()) {
        if (!_saveUpdateQueries.count(tableName)) {
            string pairs{""};
            for (const auto & col : model->columnsForQuery()) {
                if (col == "id") {
                    continue;
                }
                pairs += (col + " = :" + col + ",");
            }
            pairs.pop_back();

            auto stmt = make_shared<SQLite::Statement>(this->_db, "UPDATE " + tableName + " SET " + pairs + " WHERE id = :id");
            _saveUpdateQueries[tableName] = stmt;
        }
        auto query = _saveUpdateQueries[tableName];
        query->reset();
        model->bindToQuery(query.get());
        query->bind(":id", (long long)model->id());
        query->exec();

    } else {
        if (!_saveInsertQueries.count(tableName)) {
            string cols{""};
            string values{""};
            for (const auto & col : model->columnsForQuery()) {
                if (col == "id") {
                    continue;
                }
                cols += col + ",";
                values += ":" + col + ",";
            }
            cols.pop_back();
            values.pop_back();

            auto stmt = make_shared<SQLite::Statement>(this->_db, "INSERT INTO " + tableName + " (" + cols + ") VALUES (" + values + ")");
            _saveInsertQueries[tableName] = stmt;
        }

        auto query = _saveInsertQueries[tableName];
        query->reset();
        model->bindToQuery(query.get());
        query->exec();
        model->_data["id"] = (int64_t)_db.getLastInsertRowid();
    }
}

MailException MessageStore::persistenceError(const SQLite::Exception & ex, const char * operation) {
    spdlog::get("logger")->error("{} failed: {} (code {})", operation, ex.what(), ex.getErrorCode());
    return MailException(THREADMAIL_ERROR_PERSISTENCE, string(operation) + ": " + ex.what(), ex.getErrorCode() == SQLITE_BUSY);
}

shared_ptr<Message> MessageStore::createMessage(const MessageDraft & draft) {
    if (draft.fromAddress == "" || draft.toAddress == "") {
        throw MailException(THREADMAIL_ERROR_VALIDATION, "A message needs a sender and a recipient address");
    }

    try {
        MessageStoreTransaction transaction(this, "createMessage");

        string threadId = draft.threadId;

        // The parent is advisory: a missing parent is accepted, but an existing
        // parent always decides which thread the reply belongs to.
        if (draft.parentId != 0) {
            auto parent = find<Message>(Query().equal("id", draft.parentId));
            if (parent == nullptr) {
                spdlog::get("logger")->warn("Data quality: message claims parent {} which does not exist (thread {})", draft.parentId, threadId == "" ? "<new>" : threadId);
            } else if (threadId == "") {
                threadId = parent->threadId();
            } else if (threadId != parent->threadId()) {
                spdlog::get("logger")->warn("Data quality: reply to {} claimed thread {} but parent is in thread {}. Using the parent's thread.", draft.parentId, threadId, parent->threadId());
                threadId = parent->threadId();
            }
        }
        if (threadId == "") {
            threadId = MailUtils::idRandomlyGenerated();
        }

        nlohmann::json data = {
            {"fromAddress", draft.fromAddress},
            {"toAddress", draft.toAddress},
            {"subject", draft.subject},
            {"body", draft.body},
            {"isRich", draft.isRich},
            {"threadId", threadId},
            {"isRead", false},
            {"createdAt", draft.createdAt ? draft.createdAt : MailUtils::nowMilliseconds()},
        };
        data["fromAccountId"] = draft.fromAccountId ? nlohmann::json(draft.fromAccountId) : nlohmann::json(nullptr);
        data["toAccountId"] = draft.toAccountId ? nlohmann::json(draft.toAccountId) : nlohmann::json(nullptr);
        data["parentId"] = draft.parentId ? nlohmann::json(draft.parentId) : nlohmann::json(nullptr);

        Message message(data);
        save(&message);

        auto stored = find<Message>(Query().equal("id", message.id()));
        transaction.commit();
        return stored;

    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "createMessage");
    }
}

shared_ptr<Message> MessageStore::getMessage(int64_t id) {
    try {
        return find<Message>(Query().equal("id", id));
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "getMessage");
    }
}

vector<shared_ptr<Message>> MessageStore::getThread(string threadId) {
    try {
        return findAll<Message>(Query().equal("threadId", threadId).orderBy("createdAt ASC, id ASC"));
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "getThread");
    }
}

vector<shared_ptr<Message>> MessageStore::getInboxRoots(int64_t accountId, int limit, int offset) {
    try {
        // Representatives and their replies must come from the same snapshot.
        MessageStoreTransaction transaction(this, "getInboxRoots", true);

        SQLite::Statement query(_db, Message::SELECT_SQL +
            " WHERE Message.id IN (SELECT MIN(id) FROM Message WHERE toAccountId = ? GROUP BY threadId)"
            " ORDER BY (SELECT MAX(t.createdAt) FROM Message t WHERE t.threadId = Message.threadId) DESC, Message.id DESC"
            " LIMIT ? OFFSET ?");
        query.bind(1, (long long)accountId);
        query.bind(2, limit > 0 ? limit : -1);
        query.bind(3, offset > 0 ? offset : 0);

        vector<shared_ptr<Message>> roots;
        while (query.executeStep()) {
            roots.push_back(make_shared<Message>(query));
        }

        for (auto & root : roots) {
            auto thread = getThread(root->threadId());
            if (thread.size() <= 1) {
                continue;
            }
            vector<shared_ptr<Message>> replies;
            for (auto & member : thread) {
                if (member->id() != root->id()) {
                    replies.push_back(member);
                }
            }
            root->setReplies(replies);
        }

        transaction.commit();
        return roots;

    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "getInboxRoots");
    }
}

vector<shared_ptr<Message>> MessageStore::getSent(int64_t accountId, int limit, int offset) {
    try {
        return findAll<Message>(Query().equal("fromAccountId", accountId).orderBy("createdAt DESC, id DESC").limit(limit).offset(offset));
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "getSent");
    }
}

vector<shared_ptr<Message>> MessageStore::getInboxForAddress(string address, int limit, int offset) {
    try {
        return findAll<Message>(Query().equal("toAddress", address).orderBy("createdAt DESC, id DESC").limit(limit).offset(offset));
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "getInboxForAddress");
    }
}

bool MessageStore::markRead(int64_t id) {
    try {
        SQLite::Statement update(_db, "UPDATE Message SET isRead = 1 WHERE id = ?");
        update.bind(1, (long long)id);
        return update.exec() > 0;
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "markRead");
    }
}

int64_t MessageStore::unreadCount(int64_t accountId) {
    try {
        SQLite::Statement count(_db, "SELECT COUNT(*) FROM Message WHERE toAccountId = ? AND isRead = 0");
        count.bind(1, (long long)accountId);
        count.executeStep();
        return count.getColumn(0).getInt64();
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "unreadCount");
    }
}

vector<shared_ptr<Attachment>> MessageStore::getAttachments(int64_t messageId) {
    try {
        return findAll<Attachment>(Query().equal("messageId", messageId).orderBy("id ASC"));
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "getAttachments");
    }
}

shared_ptr<Attachment> MessageStore::getAttachment(int64_t id) {
    try {
        return find<Attachment>(Query().equal("id", id));
    } catch (SQLite::Exception & ex) {
        throw persistenceError(ex, "getAttachment");
    }
}
