/** Attachment [Threadmail]
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

#ifndef Attachment_hpp
#define Attachment_hpp

#include <stdint.h>
#include <string>

#include "nlohmann/json.hpp"
#include "SQLiteCpp/SQLiteCpp.h"

#include "threadmail/models/mail_model.hpp"


class Attachment : public MailModel {

public:
    static std::string TABLE_NAME;
    static std::string SELECT_SQL;

    Attachment(int64_t messageId, std::string filename, std::string contentType, int64_t size, std::string path);
    Attachment(nlohmann::json json);
    Attachment(SQLite::Statement & query);

    int64_t messageId();
    std::string filename();
    std::string safeFilename();
    std::string contentType();
    int64_t size();
    std::string path();

    std::string tableName();

    std::vector<std::string> columnsForQuery();
};

#endif /* Attachment_hpp */
