/** Message [Threadmail]
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

#ifndef Message_hpp
#define Message_hpp

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "SQLiteCpp/SQLiteCpp.h"

#include "threadmail/models/mail_model.hpp"


class Message : public MailModel {
    std::vector<std::shared_ptr<Message>> _replies;

public:
    static std::string TABLE_NAME;

    // Selects every Message column plus the derived attachment count.
    static std::string SELECT_SQL;

    Message(nlohmann::json json);
    Message(SQLite::Statement & query);

    int64_t fromAccountId();
    int64_t toAccountId();
    std::string fromAddress();
    std::string toAddress();
    std::string subject();
    std::string body();
    bool isRich();
    std::string threadId();
    int64_t parentId();
    bool isRead();
    int64_t createdAt();
    int attachmentCount();

    bool isRoot();
    bool isAddressedTo(int64_t accountId);
    bool involves(int64_t accountId);

    std::vector<std::shared_ptr<Message>> & replies();
    void setReplies(std::vector<std::shared_ptr<Message>> replies);

    std::string tableName();

    std::vector<std::string> columnsForQuery();

    nlohmann::json toJSONDispatch();
};

#endif /* Message_hpp */
