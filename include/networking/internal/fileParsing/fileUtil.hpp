#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sys/types.h>
#include <vector>

// THESE FUNCTIONS MAKE ZERO EFFORT TO HANDLE CONCURRENCY.
// IF WRITE FUNCTIONS ARE USED BY MULTIPLE THREADS ON THE SAME
// PATH BEHAVIOUR IS COMPLETELY UNDEFINED.

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * bytesInFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Returns the size of a file, in bytes.
 *
 * Returns:
 * -> On success:
 *    The size.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t bytesInFile(const std::filesystem::path& f_path);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * readFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads a file, from a specific offset byte (0-indexed), for read_size
 *    bytes, or when it reaches EOF, whichever is first. Stores the bytes in
 *    buff.
 *
 * Takes:
 * -> f_path:
 *    The path to the file.
 * -> read_size:
 *    The number of bytes to read. Reading less than read_size means EOF.
 * -> offset:
 *    Where to start reading from. 0 for start of file.
 * -> buff:
 *    Where to store the read bytes. Resized to the number of bytes read.
 *
 * Returns:
 * -> On success:
 *    Bytes read.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<ssize_t> readFile(const std::filesystem::path& f_path,
                                const size_t                 read_size,
                                const size_t                 offset,
                                      std::vector<uint8_t>&  buff);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * readFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads an entire file into memory.
 *
 * Returns:
 * -> On success:
 *    The file's bytes. An empty file gives an empty vector.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path& f_path);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * writeFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates or truncates the file at f_path and writes data to it. Only
 *    returns success once the data has been fsync'd to the disk.
 *
 * Takes:
 * -> f_path:
 *    The path of the file to write.
 * -> data:
 *    A pointer to the bytes to write.
 * -> len:
 *    The number of bytes at data.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE. The file may be left partially written.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int writeFile(const std::filesystem::path& f_path,
              const uint8_t*               data,
              const size_t                 len);

} //csw
