#pragma once

#include "tracker/internal/database/internal/types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createTable
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates a table with a composite primary key made of every column in
 *    primary_keys, followed by the attributes.
 *
 * Returns:
 * -> On success:
 *    std::nullopt
 * -> On failure:
 *    The SQLite error message.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::string> createTable(sqlite3*                     db,
                                       const std::string&           name,
                                       const std::vector<TableKey>& primary_keys,
                                       const std::vector<TableKey>& attributes);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * runStatement
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Prepares query, binds values to its ? parameters in order, and steps it
 *    to completion. Rows produced are appended to dest when given.
 *
 * Takes:
 * -> query:
 *    A single SQL statement.
 * -> values:
 *    One value per ? in query.
 * -> dest:
 *    Where selected rows go, nullptr for statements that return none.
 *
 * Returns:
 * -> On success:
 *    std::nullopt
 * -> On failure:
 *    The SQLite error message.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::string> runStatement(sqlite3*                     db,
                                        const std::string&           query,
                                        const std::vector<SqlValue>& values,
                                        std::vector<Row>*            dest = nullptr);

//number of rows the last INSERT, UPDATE or DELETE touched
int changedRows(sqlite3* db);

} //csw
