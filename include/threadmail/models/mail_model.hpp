/** MailModel [Threadmail]
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

#ifndef MailModel_hpp
#define MailModel_hpp

#include <stdint.h>
#include <stdio.h>
#include <vector>
#include <string>

#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"


class MailModel {
public:
    nlohmann::json _data;

    static std::string TABLE_NAME;
    virtual std::string tableName();

    MailModel(SQLite::Statement & query);
    MailModel(nlohmann::json json);
    virtual ~MailModel() {}

    int64_t id();
    bool isSaved();

    virtual void bindToQuery(SQLite::Statement * query);

    virtual std::vector<std::string> columnsForQuery() = 0;

    virtual nlohmann::json toJSON();
    virtual nlohmann::json toJSONDispatch();

protected:
    int64_t optionalInt64(const char * key);
};

#endif /* MailModel_hpp */
