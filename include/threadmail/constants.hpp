/** Constants [Threadmail]
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

#ifndef Constants_hpp
#define Constants_hpp

#include <string>
#include <vector>

#define THREADMAIL_LOGGER_NAME          "logger"

#define THREADMAIL_ERROR_VALIDATION     "validation-error"
#define THREADMAIL_ERROR_PERSISTENCE    "persistence-error"
#define THREADMAIL_ERROR_RELAY          "relay-error"
#define THREADMAIL_ERROR_LOOKUP         "lookup-error"
#define THREADMAIL_ERROR_LISTEN         "listen-error"

#define THREADMAIL_EVENT_CONNECTED      "connected"
#define THREADMAIL_EVENT_NEW_MESSAGE    "new-message"
#define THREADMAIL_EVENT_UNREAD_COUNT   "unread-count"

#define THREADMAIL_LIST_LIMIT           20
#define THREADMAIL_INBOX_DEFAULT_LIMIT  50
#define THREADMAIL_MAX_ATTACHMENT_BYTES (50 * 1024 * 1024)
#define THREADMAIL_SUBSCRIPTION_QUEUE   256

static std::vector<std::string> SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS Message ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "fromAccountId INTEGER,"
        "toAccountId INTEGER,"
        "fromAddress TEXT NOT NULL,"
        "toAddress TEXT NOT NULL,"
        "subject TEXT NOT NULL,"
        "body TEXT NOT NULL,"
        "isRich INTEGER DEFAULT 0,"
        "threadId VARCHAR(40) NOT NULL,"
        "parentId INTEGER,"
        "isRead INTEGER DEFAULT 0,"
        "createdAt INTEGER NOT NULL)",

    "CREATE INDEX IF NOT EXISTS MessageThreadIndex ON Message(threadId, createdAt)",
    "CREATE INDEX IF NOT EXISTS MessageRecipientIndex ON Message(toAccountId, isRead)",
    "CREATE INDEX IF NOT EXISTS MessageSenderIndex ON Message(fromAccountId, createdAt)",

    "CREATE TABLE IF NOT EXISTS Attachment ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "messageId INTEGER NOT NULL,"
        "filename TEXT NOT NULL,"
        "contentType TEXT NOT NULL,"
        "size INTEGER NOT NULL,"
        "path TEXT NOT NULL,"
        "createdAt INTEGER NOT NULL)",

    "CREATE INDEX IF NOT EXISTS AttachmentMessageIndex ON Attachment(messageId)",
};

#endif /* Constants_hpp */
