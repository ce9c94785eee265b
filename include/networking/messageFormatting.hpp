#pragma once

#include "fileDescriptor.hpp"
#include "sourceInfo.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csw {

/*
 * The first byte of every message is the type.
 *
 * Based on the message type, feed it into the corresponding
 * function below to extract its data.
 *
 * All message codes ending in "OK", and BYE, are a single byte with
 * no payload.
 *
 * If the first byte is FAIL, the other side rejected what was sent
 * and the rest of the message is a readable reason.
 *
 * Every integer is big-endian. IPv4 addresses are 4 bytes in network
 * order. Availability bitmaps are an 8 byte bit count followed by the
 * packed bits, index 0 in the high bit of the first byte.
 */

//GENERAL MESSAGE CODES AND FUNCTIONS
inline constexpr uint8_t FAIL               = 0x00;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createFailMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates a buffer with the error message, prepended with the FAIL code.
 *
 * Takes:
 * -> error_message:
 *    A string explaining what went wrong for the other side of the
 *    communication.
 *
 * Returns:
 * -> On success:
 *    The buffer to send over a socket.
 * -> On failure:
 *    An empty buffer, if error_message is empty.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*/
std::vector<uint8_t> createFailMessage(const std::string& error_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseFailMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message, and returns a std::string of the received error
 *    message.
 *
 * Returns:
 * -> On success:
 *    The error message.
 * -> On failure:
 *    An empty string.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*/
std::string parseFailMessage(const std::vector<uint8_t>& fail_message);

//TRACKER MESSAGE CODES AND FUNCTIONS
inline constexpr uint8_t REGISTER_REQUEST   = 0x01;
inline constexpr uint8_t REGISTER_OK        = 0x02;
inline constexpr uint8_t DEREGISTER_REQUEST = 0x03;
inline constexpr uint8_t DEREGISTER_OK      = 0x04;
inline constexpr uint8_t PEER_LIST_REQUEST  = 0x07;
inline constexpr uint8_t PEER_LIST          = 0x08;

//a file uuid paired with a peer address, carried by deregister and peer list
//requests
using FilePeerPair = std::pair<uint64_t, SourceInfo>;

//what a peer hands the tracker when registering
struct Registration {
    uint64_t   uuid = 0;
    PeerRecord record;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createRegisterRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates a buffer announcing that record.peer serves the file uuid, holding
 *    the chunks set in record.availability.
 *
 * Returns:
 * -> On success:
 *    The buffer to send over the socket.
 * -> On failure:
 *    An empty buffer, if the ip address doesn't parse or uuid is 0.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createRegisterRequest(const Registration& reg);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseRegisterRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message.
 *
 * Returns:
 * -> On success:
 *    The Registration.
 * -> On failure:
 *    A Registration with uuid set to 0.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*/
Registration parseRegisterRequest(const std::vector<uint8_t>& register_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createDeregisterRequest / parseDeregisterRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Asks the tracker to drop the peer from the swarm of a file. The parser
 *    returns a pair with uuid 0 on a malformed message.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createDeregisterRequest(const FilePeerPair& dereg);
FilePeerPair parseDeregisterRequest(const std::vector<uint8_t>& deregister_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createPeerListRequest / parsePeerListRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Asks for the swarm of a file. The SourceInfo is the requester, left out
 *    of the answer. A requester that isn't serving yet can send port 0. The
 *    parser returns a pair with uuid 0 on a malformed message.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createPeerListRequest(const FilePeerPair& request);
FilePeerPair parsePeerListRequest(const std::vector<uint8_t>& request_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createPeerList
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates the tracker's answer to a peer list request. An empty list is a
 *    valid answer.
 *
 * Returns:
 * -> On success:
 *    The buffer to send over the socket.
 * -> On failure:
 *    An empty buffer.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createPeerList(const std::vector<PeerRecord>& peers);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parsePeerList
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message. Since an empty list is valid, failure is
 *    std::nullopt rather than an empty vector.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::vector<PeerRecord>> parsePeerList(const std::vector<uint8_t>& list_message);

//PEER MESSAGE CODES AND FUNCTIONS
inline constexpr uint8_t HELLO              = 0x09;
inline constexpr uint8_t AVAILABILITY       = 0x0A;
inline constexpr uint8_t REQUEST_CHUNK      = 0x0B;
inline constexpr uint8_t DATA_CHUNK         = 0x0C;
inline constexpr uint8_t NOT_FOUND          = 0x0D;
inline constexpr uint8_t BYE                = 0x0E; //simple byte, no payload
inline constexpr uint8_t DESCRIPTOR_REQUEST = 0x10;
inline constexpr uint8_t DESCRIPTOR         = 0x11;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createHello / parseHello
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The first message each way on a peer connection, naming the file the
 *    session is about. parseHello returns 0 on a malformed message.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createHello(const uint64_t uuid);
uint64_t parseHello(const std::vector<uint8_t>& hello_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createAvailability / parseAvailability
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Advertises which chunks the sender holds. parseAvailability returns
 *    std::nullopt if the bitmap length doesn't match the bit count.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createAvailability(const std::vector<bool>& availability);
std::optional<std::vector<bool>> parseAvailability(const std::vector<uint8_t>& availability_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createChunkRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates a buffer requesting one chunk.
 *
 * Takes:
 * -> chunk:
 *    The chunk to request, 0-indexed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createChunkRequest(const size_t chunk);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseChunkRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message, and returns the chunk index requested.
 *
 * Returns:
 * -> On success:
 *    The chunk index.
 * -> On failure:
 *    SIZE_MAX. If you're requesting SIZE_MAX chunks, that's on you.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*/
size_t parseChunkRequest(const std::vector<uint8_t>& request_message);

//pair of the chunk number, 0-indexed, and the actual data
using DataChunk = std::pair<size_t, std::vector<uint8_t>>;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createDataChunk
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates a buffer carrying one chunk's bytes.
 *
 * Returns:
 * -> On success:
 *    The buffer to send over the socket.
 * -> On failure:
 *    An empty buffer.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createDataChunk(const DataChunk& chunk);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseDataChunk
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message. A data chunk could be any size, and could
 *    hold anything. It's up to the caller to verify it against the digest in
 *    the descriptor before trusting it.
 *
 * Returns:
 * -> On success:
 *    The pair of chunk index, and the byte data.
 * -> On failure:
 *    <SIZE_MAX, {}>
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*/
DataChunk parseDataChunk(const std::vector<uint8_t>& data_chunk_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createNotFound / parseNotFound
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Answer to a chunk request the server can't fill. parseNotFound returns
 *    SIZE_MAX on a malformed message.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createNotFound(const size_t chunk);
size_t parseNotFound(const std::vector<uint8_t>& not_found_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * encodeDescriptor
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The canonical byte encoding of a FileDescriptor. Used on the wire, in
 *    descriptor files, and as the input to the file id hash, so it must never
 *    change for a given descriptor.
 *
 *    ORDER:
 *    name length (2), name, file size (8), chunk size (8), chunk count (8),
 *    then chunk count digests of DIGEST_LEN bytes.
 *
 * Returns:
 * -> On success:
 *    The encoded bytes.
 * -> On failure:
 *    An empty buffer, if the name is longer than 65535 bytes or the digest
 *    count doesn't match the chunk count.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> encodeDescriptor(const FileDescriptor& descriptor);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * decodeDescriptor
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses encodeDescriptor. Rejects encodings whose length is off, whose
 *    chunk size is 0, or whose chunk count disagrees with the file size.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<FileDescriptor> decodeDescriptor(const uint8_t* data, size_t len);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createDescriptorRequest / parseDescriptorRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Asks a peer for the descriptor of a file it serves, for leechers that
 *    only know the file uuid. parseDescriptorRequest returns 0 on failure.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createDescriptorRequest(const uint64_t uuid);
uint64_t parseDescriptorRequest(const std::vector<uint8_t>& request_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createDescriptorMessage / parseDescriptorMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Carries an encoded descriptor. The receiver should check it against the
 *    uuid it asked for with fileIdentifier before trusting it.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createDescriptorMessage(const FileDescriptor& descriptor);
std::optional<FileDescriptor> parseDescriptorMessage(const std::vector<uint8_t>& descriptor_message);

} //csw
