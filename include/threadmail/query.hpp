/** Query [Threadmail]
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

#ifndef Query_hpp
#define Query_hpp

#include <stdint.h>
#include <string>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"

/**
 Builds the WHERE / ORDER BY / LIMIT tail of a SELECT against one model
 table. Clauses are keyed by column, so setting the same column twice
 replaces the earlier condition.
 */
class Query {
    nlohmann::json _clauses;
    std::string _orderBy;
    int _limit;
    int _offset;

public:
    Query() noexcept;

    Query & equal(std::string col, std::string val);
    Query & equal(std::string col, int64_t val);
    Query & equal(std::string col, std::vector<int64_t> & val);
    Query & isNull(std::string col);

    Query & gt(std::string col, int64_t val);
    Query & gte(std::string col, int64_t val);
    Query & lt(std::string col, int64_t val);
    Query & lte(std::string col, int64_t val);

    Query & orderBy(std::string clause);
    Query & limit(int l);
    Query & offset(int o);

    int getLimit();
    int getOffset();
    std::string getSQL();

    void bind(SQLite::Statement & query);
};


#endif /* Query_hpp */
