#include "threadmail/models/mail_model.hpp"
#include "threadmail/constants.hpp"
#include "threadmail/mail_exception.hpp"
#include "threadmail/mail_utils.hpp"

std::string MailModel::TABLE_NAME = "MailModel";

MailModel::MailModel(SQLite::Statement & query) :
    _data(nlohmann::json::object())
{
    for (int ii = 0; ii < query.getColumnCount(); ii ++) {
        SQLite::Column col = query.getColumn(ii);
        std::string name = query.getColumnName(ii);
        if (col.isNull()) {
            _data[name] = nullptr;
        } else if (col.isInteger()) {
            _data[name] = (int64_t)col.getInt64();
        } else if (col.isFloat()) {
            _data[name] = col.getDouble();
        } else {
            _data[name] = col.getString();
        }
    }
}

MailModel::MailModel(nlohmann::json json) :
    _data(json)
{
    if (!_data.is_object()) {
        throw MailException(THREADMAIL_ERROR_VALIDATION, "Model data must be a JSON object");
    }
}

int64_t MailModel::id()
{
    return optionalInt64("id");
}

bool MailModel::isSaved()
{
    return id() > 0;
}

int64_t MailModel::optionalInt64(const char * key)
{
    if (!_data.count(key) || !_data[key].is_number()) {
        return 0;
    }
    return _data[key].get<int64_t>();
}

std::string MailModel::tableName()
{
    return TABLE_NAME;
}

nlohmann::json MailModel::toJSON()
{
    if (!_data.count("__cls")) {
        _data["__cls"] = this->tableName();
    }
    return _data;
}

nlohmann::json MailModel::toJSONDispatch()
{
    return this->toJSON();
}

// Binds every column except `id`, which SQLite assigns on insert.
void MailModel::bindToQuery(SQLite::Statement * query) {
    for (const auto & col : columnsForQuery()) {
        if (col == "id") {
            continue;
        }
        std::string param = ":" + col;
        if (!_data.count(col) || _data[col].is_null()) {
            query->bind(param.c_str());
            continue;
        }
        nlohmann::json & val = _data[col];
        if (val.is_boolean()) {
            query->bind(param.c_str(), val.get<bool>() ? 1 : 0);
        } else if (val.is_number_integer()) {
            query->bind(param.c_str(), (long long)val.get<int64_t>());
        } else if (val.is_number()) {
            query->bind(param.c_str(), val.get<double>());
        } else if (val.is_string()) {
            query->bind(param.c_str(), val.get<std::string>());
        } else {
            query->bind(param.c_str(), MailUtils::dumpJSON(val));
        }
    }
}
