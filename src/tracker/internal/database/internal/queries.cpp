#include "tracker/internal/database/internal/queries.hpp"

#include <memory>

namespace csw {

//finalizes a prepared statement however the function using it returns
struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

std::optional<std::string> createTable(sqlite3*                     db,
                                       const std::string&           name,
                                       const std::vector<TableKey>& primary_keys,
                                       const std::vector<TableKey>& attributes) {
    std::string query = "CREATE TABLE " + name + "(";

    //key columns
    for (size_t i = 0; i < primary_keys.size(); i++) {
        if (i != 0) query += ",";
        query += primary_keys[i].first + " " + primary_keys[i].second + " NOT NULL";
    }

    //attributes
    for (auto& entry : attributes) {
        query += ",";
        query += entry.first + " " + entry.second;
    }

    //composite primary key
    query += ",PRIMARY KEY (";
    for (size_t i = 0; i < primary_keys.size(); i++) {
        if (i != 0) query += ",";
        query += primary_keys[i].first;
    }
    query += "));";

    char* err = nullptr;
    if (sqlite3_exec(db, query.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "could not create table " + name;
        sqlite3_free(err);
        return msg;
    }
    return std::nullopt;
}

static int bindValue(sqlite3_stmt* stmt, int pos, const SqlValue& val) {
    if (auto v = std::get_if<int64_t>(&val))
        return sqlite3_bind_int64(stmt, pos, *v);
    else if (auto v = std::get_if<std::string>(&val))
        return sqlite3_bind_text(stmt, pos, v->c_str(), static_cast<int>(v->size()), SQLITE_TRANSIENT);

    const auto& blob = std::get<std::vector<uint8_t>>(val);
    //a zero length blob still has to be a blob, not NULL
    if (blob.empty())
        return sqlite3_bind_zeroblob(stmt, pos, 0);
    return sqlite3_bind_blob(stmt, pos, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

static Row readRow(sqlite3_stmt* stmt) {
    Row row;
    int columns = sqlite3_column_count(stmt);
    for (int i = 0; i < columns; i++) {
        switch (sqlite3_column_type(stmt, i)) {
            case SQLITE_INTEGER:
                row.emplace_back(static_cast<int64_t>(sqlite3_column_int64(stmt, i)));
                break;
            case SQLITE_BLOB: {
                auto data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, i));
                int  len  = sqlite3_column_bytes(stmt, i);
                row.emplace_back(std::vector<uint8_t>(data, data+len));
                break;
            }
            case SQLITE_NULL:
                row.emplace_back(std::vector<uint8_t>());
                break;
            default: {
                auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
                row.emplace_back(std::string(text ? text : ""));
                break;
            }
        }
    }
    return row;
}

std::optional<std::string> runStatement(sqlite3*                     db,
                                        const std::string&           query,
                                        const std::vector<SqlValue>& values,
                                        std::vector<Row>*            dest) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, query.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        return std::string(sqlite3_errmsg(db));
    Statement stmt(raw);

    for (size_t i = 0; i < values.size(); i++) {
        if (bindValue(stmt.get(), static_cast<int>(i+1), values[i]) != SQLITE_OK)
            return std::string(sqlite3_errmsg(db));
    }

    int res;
    while ((res = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        if (dest)
            dest->push_back(readRow(stmt.get()));
    }

    if (res != SQLITE_DONE)
        return std::string(sqlite3_errmsg(db));
    return std::nullopt;
}

int changedRows(sqlite3* db) {
    return sqlite3_changes(db);
}

} //csw
