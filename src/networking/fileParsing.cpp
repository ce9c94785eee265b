#include "networking/fileParsing.hpp"
#include "networking/internal/fileParsing/fileUtil.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"
#include "networking/messageFormatting.hpp"
#include "errorCodes.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <openssl/evp.h>

namespace csw {

//tag at the front of every descriptor file
static const uint8_t DESCRIPTOR_MAGIC[] = {'C', 'S', 'W', 'D'};

std::optional<Digest> sha256Digest(const uint8_t* data, const size_t len) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        return std::nullopt;

    if (1 != EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), NULL))
        return std::nullopt;

    if (len > 0 && 1 != EVP_DigestUpdate(mdctx.get(), data, len))
        return std::nullopt;

    uint8_t digest[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (1 != EVP_DigestFinal_ex(mdctx.get(), digest, &hash_len))
        return std::nullopt;

    if (hash_len != DIGEST_LEN)
        return std::nullopt;

    Digest out;
    std::memcpy(out.data(), digest, DIGEST_LEN);
    return out;
}

std::optional<std::pair<FileDescriptor, std::vector<Chunk>>> splitFile(const std::string&          f_name,
                                                                      const std::vector<uint8_t>& bytes,
                                                                      const uint64_t              chunk_size) {
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE)
        return std::nullopt;

    FileDescriptor descriptor;
    descriptor.f_name      = std::filesystem::path(f_name).filename().string();
    descriptor.f_size      = bytes.size();
    descriptor.chunk_size  = chunk_size;
    descriptor.chunk_count = bytes.size() / chunk_size + (bytes.size() % chunk_size != 0);

    std::vector<Chunk> chunks;
    chunks.reserve(descriptor.chunk_count);
    descriptor.digests.reserve(descriptor.chunk_count);

    for (size_t i = 0; i < descriptor.chunk_count; ++i) {
        uint64_t offset = descriptor.chunkOffset(i);
        uint64_t len    = descriptor.chunkLength(i);

        auto digest = sha256Digest(bytes.data()+offset, len);
        if (!digest)
            return std::nullopt;

        Chunk c;
        c.index  = i;
        c.digest = digest.value();
        c.data   = std::vector<uint8_t>(bytes.begin()+offset, bytes.begin()+offset+len);

        descriptor.digests.push_back(c.digest);
        chunks.push_back(std::move(c));
    }

    return std::make_pair(std::move(descriptor), std::move(chunks));
}

bool verifyChunk(const uint8_t* data, const size_t len, const Digest& expected) {
    auto digest = sha256Digest(data, len);
    if (!digest)
        return false;
    return digest.value() == expected;
}

bool verifyChunk(const std::vector<uint8_t>& data, const Digest& expected) {
    return verifyChunk(data.data(), data.size(), expected);
}

int reassemble(const ChunkMap&       chunks,
               const FileDescriptor& descriptor,
               std::vector<uint8_t>& out) {
    out.clear();
    if (descriptor.digests.size() != descriptor.chunk_count)
        return CORRUPT_CHUNK;

    //missing chunks are checked for first, before hashing anything
    for (size_t i = 0; i < descriptor.chunk_count; ++i)
        if (chunks.find(i) == chunks.end())
            return INCOMPLETE;

    out.reserve(descriptor.f_size);
    for (size_t i = 0; i < descriptor.chunk_count; ++i) {
        const auto& data = chunks.at(i);
        if (data.size() != descriptor.chunkLength(i) || !verifyChunk(data, descriptor.digests[i])) {
            std::cerr << "[reassemble] Chunk " << i << " of " << descriptor.f_name
                      << " failed verification" << std::endl;
            out.clear();
            return CORRUPT_CHUNK;
        }
        out.insert(out.end(), data.begin(), data.end());
    }

    return EXIT_SUCCESS;
}

int reassembleToFile(const ChunkMap&              chunks,
                     const FileDescriptor&        descriptor,
                     const std::filesystem::path& f_path) {
    std::vector<uint8_t> bytes;
    int res = reassemble(chunks, descriptor, bytes);
    if (res != EXIT_SUCCESS)
        return res;

    return writeFile(f_path, bytes.data(), bytes.size());
}

union DigestMap {
    uint64_t uuid;
    uint8_t  digest[8];
};

uint64_t fileIdentifier(const FileDescriptor& descriptor) {
    std::vector<uint8_t> encoded = encodeDescriptor(descriptor);
    if (encoded.empty())
        return 0;

    auto digest = sha256Digest(encoded.data(), encoded.size());
    if (!digest)
        return 0;

    DigestMap dm;
    std::memcpy(dm.digest, digest->data(), sizeof(uint64_t));

    //big and little endian machines have to agree on the id
    int err_code = 0;
    dm.uuid = fromNetworkOrder(dm.uuid, err_code);
    return dm.uuid;
}

int saveDescriptor(const FileDescriptor& descriptor, const std::filesystem::path& f_path) {
    std::vector<uint8_t> encoded = encodeDescriptor(descriptor);
    if (encoded.empty())
        return EXIT_FAILURE;

    std::vector<uint8_t> contents(std::begin(DESCRIPTOR_MAGIC), std::end(DESCRIPTOR_MAGIC));
    contents.insert(contents.end(), encoded.begin(), encoded.end());
    return writeFile(f_path, contents.data(), contents.size());
}

std::optional<FileDescriptor> loadDescriptor(const std::filesystem::path& f_path) {
    auto contents = readFile(f_path);
    if (!contents)
        return std::nullopt;

    const size_t magic_len = sizeof(DESCRIPTOR_MAGIC);
    if (contents->size() < magic_len ||
        !std::equal(std::begin(DESCRIPTOR_MAGIC), std::end(DESCRIPTOR_MAGIC), contents->begin()))
        return std::nullopt;

    return decodeDescriptor(contents->data()+magic_len, contents->size()-magic_len);
}

} //csw
