#include "threadmail/query.hpp"
#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_utils.hpp"
#include "threadmail/mail_exception.hpp"

#include "spdlog/spdlog.h"

Query::Query() noexcept : _clauses(nlohmann::json::object()), _orderBy(""), _limit(0), _offset(0) {
}

Query & Query::equal(std::string col, std::string val) {
    _clauses[col] = {{"op","="}, {"rhs", val}};
    return *this;
}

Query & Query::equal(std::string col, int64_t val) {
    _clauses[col] = {{"op","="}, {"rhs", val}};
    return *this;
}

Query & Query::equal(std::string col, std::vector<int64_t> & val) {
    if (val.size() > 999) {
        spdlog::get("logger")->warn("Attempting to construct WHERE {} IN () query with >999 values ({}), this will fail.", col, val.size());
    }
    _clauses[col] = {{"op","="}, {"rhs", val}};
    return *this;
}

Query & Query::isNull(std::string col) {
    _clauses[col] = {{"op","IS NULL"}, {"rhs", nullptr}};
    return *this;
}

Query & Query::gt(std::string col, int64_t val) {
    _clauses[col] = {{"op",">"}, {"rhs", val}};
    return *this;
}

Query & Query::gte(std::string col, int64_t val) {
    _clauses[col] = {{"op",">="}, {"rhs", val}};
    return *this;
}

Query & Query::lt(std::string col, int64_t val) {
    _clauses[col] = {{"op","<"}, {"rhs", val}};
    return *this;
}

Query & Query::lte(std::string col, int64_t val) {
    _clauses[col] = {{"op","<="}, {"rhs", val}};
    return *this;
}

Query & Query::orderBy(std::string clause) {
    _orderBy = clause;
    return *this;
}

Query & Query::limit(int l) {
    _limit = l;
    return *this;
}

Query & Query::offset(int o) {
    _offset = o;
    return *this;
}

int Query::getLimit() {
    return _limit;
}

int Query::getOffset() {
    return _offset;
}

std::string Query::getSQL() {
    std::string result = "";

    if (_clauses.size() > 0) {
        result += " WHERE ";

        for (nlohmann::json::iterator it = _clauses.begin(); it != _clauses.end(); ++it) {
            if (it != _clauses.begin()) {
                result += " AND ";
            }
            std::string op = it.value()["op"].get<std::string>();
            nlohmann::json & rhs = it.value()["rhs"];

            if (rhs.is_null()) {
                result += it.key() + " " + op;
            } else if (rhs.is_array()) {
                if (op != "=") {
                    throw MailException(THREADMAIL_ERROR_PERSISTENCE, "Cannot use query operator " + op + " with an array of values");
                }
                if (rhs.size() == 0) {
                    result += "0 = 1";
                    continue;
                }
                result += it.key() + " IN (" + MailUtils::qmarks(rhs.size()) + ")";
            } else {
                result += it.key() + " " + op + " ?";
            }
        }
    }
    if (_orderBy != "") {
        result += " ORDER BY " + _orderBy;
    }
    if (_limit > 0) {
        result += " LIMIT " + std::to_string(_limit);
        if (_offset > 0) {
            result += " OFFSET " + std::to_string(_offset);
        }
    }
    return result;
}

static void bindValue(SQLite::Statement & query, int ii, nlohmann::json & val) {
    if (val.is_number_integer()) {
        query.bind(ii, val.get<int64_t>());
    } else if (val.is_number()) {
        query.bind(ii, val.get<double>());
    } else if (val.is_string()) {
        query.bind(ii, val.get<std::string>());
    } else {
        throw MailException(THREADMAIL_ERROR_PERSISTENCE, "Unsure of how to bind json to sqlite");
    }
}

void Query::bind(SQLite::Statement & query) {
    int ii = 1;
    for (nlohmann::json::iterator it = _clauses.begin(); it != _clauses.end(); ++it) {
        nlohmann::json & rhs = it.value()["rhs"];

        if (rhs.is_null()) {
            continue;
        }
        if (rhs.is_array()) {
            for (nlohmann::json::iterator at = rhs.begin(); at != rhs.end(); ++at) {
                bindValue(query, ii++, *at);
            }
        } else {
            bindValue(query, ii++, rhs);
        }
    }
}
