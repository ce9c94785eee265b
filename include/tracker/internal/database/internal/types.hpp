#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace csw {

//Column of a table
using TableKey = std::pair<std::string, //KEY_NAME
                           std::string  //KEY_TYPE
                          >;

//a value bound into, or read out of, a statement
using SqlValue = std::variant<int64_t,             //INT
                              std::string,         //TEXT
                              std::vector<uint8_t> //BLOB
                             >;

//format that rows from the table are returned as, one value per column
using Row = std::vector<SqlValue>;

} //csw
