#include "networking/messageFormatting.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>

namespace csw {

inline constexpr size_t IP_LEN      = sizeof(uint32_t);
inline constexpr size_t ADDRESS_LEN = sizeof(uint16_t) + IP_LEN; //port, then ip

//ONLY DEFINED IF dest IS SIZED TO ALWAYS HAVE ROOM
//puts inputs in network-byte order (BE)
//if a std::string is given as input, it's assumed to be a IPv4 addr, and inet
//functions are used to cast IP into uint32_t.
template <typename T>
static void createNetworkData(uint8_t* dest, const T& data, size_t& offset, int& err_code) {
    if constexpr (std::is_same_v<T, std::string>) {
        uint32_t network_data = getIpBytes(data); //inet_pton() already gives BE
        if (network_data == 0)
            err_code = 1;
        std::memcpy(dest+offset, &network_data, IP_LEN);
        offset += IP_LEN;
    } else {
        T network_data = toNetworkOrder(data, err_code);
        std::memcpy(dest+offset, &network_data, sizeof(T));
        offset += sizeof(T);
    }
}

//endian-safe casting via fromNetworkOrder template function in byteOrdering.hpp
//if a std::string is passed as destination it's assumed to be an IPv4 addr,
//and inet parsing functions are used instead.
template <typename T>
static void parseNetworkData(T* dest, const uint8_t* buff, size_t& offset, int& err_code) {
    if constexpr (std::is_same_v<T, std::string>) {
        std::string ip_str = ipBytesToString(buff+offset);
        if (ip_str.empty())
            err_code = 1;
        *dest = ip_str;
        offset += IP_LEN;
    } else {
        T network_data;
        std::memcpy(&network_data, buff+offset, sizeof(T));
        *dest = fromNetworkOrder(network_data, err_code);
        offset += sizeof(T);
    }
}

//appends a bit count and the packed bitmap
static void createBitmapData(std::vector<uint8_t>& dest,
                             const std::vector<bool>& bits,
                             size_t& offset,
                             int& err_code) {
    std::vector<uint8_t> packed = packBits(bits);
    dest.resize(offset + sizeof(uint64_t) + packed.size());
    createNetworkData(dest.data(), static_cast<uint64_t>(bits.size()), offset, err_code);
    if (!packed.empty())
        std::memcpy(dest.data()+offset, packed.data(), packed.size());
    offset += packed.size();
}

//reads a bit count and the packed bitmap, bounds checked against msg_len
static std::vector<bool> parseBitmapData(const uint8_t* buff,
                                         size_t msg_len,
                                         size_t& offset,
                                         int& err_code) {
    if (msg_len - offset < sizeof(uint64_t)) {
        err_code = 1;
        return {};
    }

    uint64_t bit_count = 0;
    parseNetworkData(&bit_count, buff, offset, err_code);
    //guard the rounding in bitmapLen against overflow
    if (bit_count > (msg_len - offset) * 8) {
        err_code = 1;
        return {};
    }

    size_t map_len = bitmapLen(bit_count);
    if (msg_len - offset < map_len) {
        err_code = 1;
        return {};
    }

    std::vector<bool> bits = unpackBits(buff+offset, bit_count);
    offset += map_len;
    return bits;
}

//messages that are a code followed by one 8 byte value
static std::vector<uint8_t> createCodeAndValue(const uint8_t code, const uint64_t val) {
    std::vector<uint8_t> buff = {code};
    buff.resize(1+sizeof(uint64_t));

    size_t offset = 1;
    int err_code  = 0;
    createNetworkData(buff.data(), val, offset, err_code);

    if (err_code != 0)
        return {};
    return buff;
}

static std::optional<uint64_t> parseCodeAndValue(const uint8_t code, const std::vector<uint8_t>& message) {
    if (message.size() != 1+sizeof(uint64_t))
        return std::nullopt;
    else if (message.front() != code)
        return std::nullopt;

    size_t offset = 1;
    int err_code  = 0;
    uint64_t val;
    parseNetworkData(&val, message.data(), offset, err_code);

    if (err_code != 0)
        return std::nullopt;
    return val;
}

//messages that are a code, a file uuid and a peer address
static std::vector<uint8_t> createFilePeerMessage(const uint8_t code, const FilePeerPair& pair) {
    if (pair.first == 0)
        return {};

    std::vector<uint8_t> buff = {code};
    buff.resize(1+sizeof(uint64_t)+ADDRESS_LEN);

    size_t offset = 1;
    int err_code  = 0;

    //ORDER:
    //file uuid, peer port, peer ip
    createNetworkData(buff.data(), pair.first,          offset, err_code);
    createNetworkData(buff.data(), pair.second.port,    offset, err_code);
    createNetworkData(buff.data(), pair.second.ip_addr, offset, err_code);

    if (err_code != 0)
        return {};
    return buff;
}

static FilePeerPair parseFilePeerMessage(const uint8_t code, const std::vector<uint8_t>& message) {
    FilePeerPair pair(0, SourceInfo());
    if (message.size() != 1+sizeof(uint64_t)+ADDRESS_LEN)
        return pair;
    else if (message.front() != code)
        return pair;

    size_t offset = 1;
    int err_code  = 0;

    //pull stuff out in the same order as it was inserted by createFilePeerMessage
    parseNetworkData(&pair.first,          message.data(), offset, err_code);
    parseNetworkData(&pair.second.port,    message.data(), offset, err_code);
    parseNetworkData(&pair.second.ip_addr, message.data(), offset, err_code);

    if (err_code != 0)
        pair.first = 0;
    return pair;
}

std::vector<uint8_t> createFailMessage(const std::string& error_message) {
    if (error_message.empty())
        return {};

    std::vector<uint8_t> message_buff = {FAIL};
    message_buff.resize(1+error_message.length());
    std::memcpy(message_buff.data()+1, error_message.c_str(), error_message.length());

    return message_buff;
}

std::string parseFailMessage(const std::vector<uint8_t>& fail_message) {
    if (fail_message.size() < 2)
        return "";
    else if (fail_message.front() != FAIL)
        return "";
    return std::string(fail_message.begin()+1, fail_message.end());
}

//TRACKER MESSAGE CODES AND FUNCTIONS

std::vector<uint8_t> createRegisterRequest(const Registration& reg) {
    if (reg.uuid == 0)
        return {};

    std::vector<uint8_t> reg_buff = {REGISTER_REQUEST};
    reg_buff.resize(1+sizeof(uint64_t)+ADDRESS_LEN);

    size_t offset = 1;
    int err_code  = 0;

    //ORDER:
    //file uuid, peer port, peer ip, availability
    createNetworkData(reg_buff.data(), reg.uuid,                offset, err_code);
    createNetworkData(reg_buff.data(), reg.record.peer.port,    offset, err_code);
    createNetworkData(reg_buff.data(), reg.record.peer.ip_addr, offset, err_code);
    createBitmapData(reg_buff, reg.record.availability, offset, err_code);

    if (err_code != 0)
        return {};
    return reg_buff;
}

Registration parseRegisterRequest(const std::vector<uint8_t>& register_message) {
    Registration reg;
    if (register_message.size() < 1+sizeof(uint64_t)+ADDRESS_LEN+sizeof(uint64_t))
        return reg;
    else if (register_message.front() != REGISTER_REQUEST)
        return reg;

    size_t offset = 1;
    int err_code  = 0;

    parseNetworkData(&reg.uuid,                register_message.data(), offset, err_code);
    parseNetworkData(&reg.record.peer.port,    register_message.data(), offset, err_code);
    parseNetworkData(&reg.record.peer.ip_addr, register_message.data(), offset, err_code);
    reg.record.availability = parseBitmapData(register_message.data(),
                                              register_message.size(),
                                              offset,
                                              err_code);

    //trailing bytes mean the sender and us disagree on the layout
    if (err_code != 0 || offset != register_message.size() || reg.record.peer.port == 0)
        reg.uuid = 0;
    return reg;
}

std::vector<uint8_t> createDeregisterRequest(const FilePeerPair& dereg) {
    return createFilePeerMessage(DEREGISTER_REQUEST, dereg);
}

FilePeerPair parseDeregisterRequest(const std::vector<uint8_t>& deregister_message) {
    return parseFilePeerMessage(DEREGISTER_REQUEST, deregister_message);
}

std::vector<uint8_t> createPeerListRequest(const FilePeerPair& request) {
    return createFilePeerMessage(PEER_LIST_REQUEST, request);
}

FilePeerPair parsePeerListRequest(const std::vector<uint8_t>& request_message) {
    return parseFilePeerMessage(PEER_LIST_REQUEST, request_message);
}

std::vector<uint8_t> createPeerList(const std::vector<PeerRecord>& peers) {
    std::vector<uint8_t> list_buff = {PEER_LIST};
    list_buff.resize(1+sizeof(uint64_t));

    size_t offset = 1;
    int err_code  = 0;

    //ORDER:
    //peer count, then port, ip, availability for every peer
    createNetworkData(list_buff.data(), static_cast<uint64_t>(peers.size()), offset, err_code);
    for (auto& p : peers) {
        list_buff.resize(offset+ADDRESS_LEN);
        createNetworkData(list_buff.data(), p.peer.port,    offset, err_code);
        createNetworkData(list_buff.data(), p.peer.ip_addr, offset, err_code);
        createBitmapData(list_buff, p.availability, offset, err_code);
    }

    if (err_code != 0)
        return {};
    return list_buff;
}

std::optional<std::vector<PeerRecord>> parsePeerList(const std::vector<uint8_t>& list_message) {
    if (list_message.size() < 1+sizeof(uint64_t))
        return std::nullopt;
    else if (list_message.front() != PEER_LIST)
        return std::nullopt;

    size_t offset = 1;
    int err_code  = 0;
    uint64_t count = 0;
    parseNetworkData(&count, list_message.data(), offset, err_code);

    //every record is at least an address and a bit count
    constexpr size_t MIN_RECORD_LEN = ADDRESS_LEN + sizeof(uint64_t);
    if (count > (list_message.size() - offset) / MIN_RECORD_LEN)
        return std::nullopt;

    std::vector<PeerRecord> peers;
    peers.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        if (list_message.size() - offset < MIN_RECORD_LEN)
            return std::nullopt;

        PeerRecord p;
        parseNetworkData(&p.peer.port,    list_message.data(), offset, err_code);
        parseNetworkData(&p.peer.ip_addr, list_message.data(), offset, err_code);
        p.availability = parseBitmapData(list_message.data(), list_message.size(), offset, err_code);
        if (err_code != 0)
            return std::nullopt;
        peers.push_back(std::move(p));
    }

    if (offset != list_message.size())
        return std::nullopt;
    return peers;
}

//PEER MESSAGE CODES AND FUNCTIONS

std::vector<uint8_t> createHello(const uint64_t uuid) {
    if (uuid == 0)
        return {};
    return createCodeAndValue(HELLO, uuid);
}

uint64_t parseHello(const std::vector<uint8_t>& hello_message) {
    return parseCodeAndValue(HELLO, hello_message).value_or(0);
}

std::vector<uint8_t> createAvailability(const std::vector<bool>& availability) {
    std::vector<uint8_t> avail_buff = {AVAILABILITY};
    size_t offset = 1;
    int err_code  = 0;

    createBitmapData(avail_buff, availability, offset, err_code);

    if (err_code != 0)
        return {};
    return avail_buff;
}

std::optional<std::vector<bool>> parseAvailability(const std::vector<uint8_t>& availability_message) {
    if (availability_message.empty() || availability_message.front() != AVAILABILITY)
        return std::nullopt;

    size_t offset = 1;
    int err_code  = 0;
    std::vector<bool> bits = parseBitmapData(availability_message.data(),
                                             availability_message.size(),
                                             offset,
                                             err_code);

    if (err_code != 0 || offset != availability_message.size())
        return std::nullopt;
    return bits;
}

std::vector<uint8_t> createChunkRequest(const size_t chunk) {
    return createCodeAndValue(REQUEST_CHUNK, static_cast<uint64_t>(chunk));
}

size_t parseChunkRequest(const std::vector<uint8_t>& request_message) {
    auto index = parseCodeAndValue(REQUEST_CHUNK, request_message);
    if (!index)
        return SIZE_MAX;
    return static_cast<size_t>(index.value());
}

std::vector<uint8_t> createDataChunk(const DataChunk& chunk) {
    std::vector<uint8_t> chunk_buff = {DATA_CHUNK};
    chunk_buff.resize(1+sizeof(uint64_t)+chunk.second.size());

    size_t offset = 1;
    int err_code  = 0;

    //ORDER:
    //chunk index, chunk bytes
    createNetworkData(chunk_buff.data(), static_cast<uint64_t>(chunk.first), offset, err_code);
    if (!chunk.second.empty())
        std::memcpy(chunk_buff.data()+offset, chunk.second.data(), chunk.second.size());

    if (err_code != 0)
        return {};
    return chunk_buff;
}

DataChunk parseDataChunk(const std::vector<uint8_t>& data_chunk_message) {
    DataChunk chunk(SIZE_MAX, {});
    if (data_chunk_message.size() < 1+sizeof(uint64_t))
        return chunk;
    else if (data_chunk_message.front() != DATA_CHUNK)
        return chunk;

    size_t offset = 1;
    int err_code  = 0;
    uint64_t index;
    parseNetworkData(&index, data_chunk_message.data(), offset, err_code);

    if (err_code != 0)
        return chunk;

    chunk.first  = static_cast<size_t>(index);
    chunk.second = std::vector<uint8_t>(data_chunk_message.begin()+offset, data_chunk_message.end());
    return chunk;
}

std::vector<uint8_t> createNotFound(const size_t chunk) {
    return createCodeAndValue(NOT_FOUND, static_cast<uint64_t>(chunk));
}

size_t parseNotFound(const std::vector<uint8_t>& not_found_message) {
    auto index = parseCodeAndValue(NOT_FOUND, not_found_message);
    if (!index)
        return SIZE_MAX;
    return static_cast<size_t>(index.value());
}

std::vector<uint8_t> encodeDescriptor(const FileDescriptor& descriptor) {
    if (descriptor.f_name.size() > UINT16_MAX)
        return {};
    else if (descriptor.digests.size() != descriptor.chunk_count)
        return {};

    std::vector<uint8_t> desc_buff;
    desc_buff.resize(sizeof(uint16_t) + descriptor.f_name.size() + 3*sizeof(uint64_t)
                     + descriptor.digests.size()*DIGEST_LEN);

    size_t offset = 0;
    int err_code  = 0;

    createNetworkData(desc_buff.data(), static_cast<uint16_t>(descriptor.f_name.size()), offset, err_code);
    std::memcpy(desc_buff.data()+offset, descriptor.f_name.data(), descriptor.f_name.size());
    offset += descriptor.f_name.size();
    createNetworkData(desc_buff.data(), descriptor.f_size,      offset, err_code);
    createNetworkData(desc_buff.data(), descriptor.chunk_size,  offset, err_code);
    createNetworkData(desc_buff.data(), descriptor.chunk_count, offset, err_code);
    for (auto& d : descriptor.digests) {
        std::memcpy(desc_buff.data()+offset, d.data(), DIGEST_LEN);
        offset += DIGEST_LEN;
    }

    if (err_code != 0)
        return {};
    return desc_buff;
}

std::optional<FileDescriptor> decodeDescriptor(const uint8_t* data, size_t len) {
    if (data == nullptr || len < sizeof(uint16_t))
        return std::nullopt;

    FileDescriptor descriptor;
    size_t offset = 0;
    int err_code  = 0;

    uint16_t name_len = 0;
    parseNetworkData(&name_len, data, offset, err_code);
    if (len - offset < name_len + 3*sizeof(uint64_t))
        return std::nullopt;

    descriptor.f_name = std::string(reinterpret_cast<const char*>(data+offset), name_len);
    offset += name_len;
    parseNetworkData(&descriptor.f_size,      data, offset, err_code);
    parseNetworkData(&descriptor.chunk_size,  data, offset, err_code);
    parseNetworkData(&descriptor.chunk_count, data, offset, err_code);

    if (err_code != 0 || descriptor.chunk_size == 0)
        return std::nullopt;

    uint64_t expected_count = descriptor.f_size / descriptor.chunk_size
                              + (descriptor.f_size % descriptor.chunk_size != 0);
    if (descriptor.chunk_count != expected_count)
        return std::nullopt;
    if ((len - offset) % DIGEST_LEN != 0 || (len - offset) / DIGEST_LEN != descriptor.chunk_count)
        return std::nullopt;

    descriptor.digests.resize(descriptor.chunk_count);
    for (auto& d : descriptor.digests) {
        std::memcpy(d.data(), data+offset, DIGEST_LEN);
        offset += DIGEST_LEN;
    }

    return descriptor;
}

std::vector<uint8_t> createDescriptorRequest(const uint64_t uuid) {
    if (uuid == 0)
        return {};
    return createCodeAndValue(DESCRIPTOR_REQUEST, uuid);
}

uint64_t parseDescriptorRequest(const std::vector<uint8_t>& request_message) {
    return parseCodeAndValue(DESCRIPTOR_REQUEST, request_message).value_or(0);
}

std::vector<uint8_t> createDescriptorMessage(const FileDescriptor& descriptor) {
    std::vector<uint8_t> encoded = encodeDescriptor(descriptor);
    if (encoded.empty())
        return {};

    std::vector<uint8_t> desc_buff = {DESCRIPTOR};
    desc_buff.insert(desc_buff.end(), encoded.begin(), encoded.end());
    return desc_buff;
}

std::optional<FileDescriptor> parseDescriptorMessage(const std::vector<uint8_t>& descriptor_message) {
    if (descriptor_message.size() < 2 || descriptor_message.front() != DESCRIPTOR)
        return std::nullopt;
    return decodeDescriptor(descriptor_message.data()+1, descriptor_message.size()-1);
}

} //csw
