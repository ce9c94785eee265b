#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace csw {

//SHA-256 digest of a chunk
inline constexpr size_t DIGEST_LEN = 32;
using Digest = std::array<uint8_t, DIGEST_LEN>;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * FileDescriptor
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Identifies a shared file. Built once by whoever first chunks the file,
 *    never modified afterwards, and handed around by value to every peer.
 *
 * Fields:
 * -> f_name:
 *    The file name, without any directories.
 * -> f_size:
 *    Total size of the file in bytes.
 * -> chunk_size:
 *    Size of every chunk but the last, which may be shorter.
 * -> chunk_count:
 *    Number of chunks, ceil(f_size / chunk_size).
 * -> digests:
 *    chunk_count SHA-256 digests, ordered by chunk index.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct FileDescriptor {
    std::string         f_name;
    uint64_t            f_size      = 0;
    uint64_t            chunk_size  = 0;
    uint64_t            chunk_count = 0;
    std::vector<Digest> digests;

    //byte offset of a chunk in the file
    uint64_t chunkOffset(const size_t index) const {
        return static_cast<uint64_t>(index) * chunk_size;
    }

    //expected length of a chunk, 0 for indices past the end
    uint64_t chunkLength(const size_t index) const {
        if (index >= chunk_count)
            return 0;
        uint64_t offset = chunkOffset(index);
        return (f_size - offset < chunk_size) ? f_size - offset : chunk_size;
    }

    bool operator==(const FileDescriptor& other) const {
        return f_name      == other.f_name      &&
               f_size      == other.f_size      &&
               chunk_size  == other.chunk_size  &&
               chunk_count == other.chunk_count &&
               digests     == other.digests;
    }
};

} //csw
