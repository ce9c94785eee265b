#pragma once

#include <cstdint>
#include <endian.h>
#include <string>
#include <type_traits>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * toNetworkOrder
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Converts a fixed-width integer representation into big-endian, regardless
 *    of host ordering.
 *
 * Takes:
 * -> host_data:
 *    One of:
 *    -> uint8_t  (returned unchanged)
 *    -> uint16_t
 *    -> uint32_t
 *    -> uint64_t
 * -> err_flag:
 *    A reference to an integer. If an error occurs, this integer is set to 1.
 *
 * Returns:
 * -> On success:
 *    A big endian version of the input.
 * -> On failure:
 *    Return is undefined. err_flag will be set.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
template <typename T>
T toNetworkOrder(T host_data, int& err_flag) {
    static_assert(std::is_unsigned_v<T>, "network ordering needs an unsigned type");
    if constexpr (sizeof(T) == sizeof(uint8_t))
        return host_data;
    else if constexpr (sizeof(T) == sizeof(uint16_t))
        return htobe16(host_data);
    else if constexpr (sizeof(T) == sizeof(uint32_t))
        return htobe32(host_data);
    else if constexpr (sizeof(T) == sizeof(uint64_t))
        return htobe64(host_data);

    err_flag = 1;
    return host_data;
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * fromNetworkOrder
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses the above operation. Takes a big-endian fixed-width integer
 *    representation and converts it to the host-machine's ordering.
 *
 * Takes:
 * -> network_data:
 *    Same types as toNetworkOrder.
 * -> err_flag:
 *    A reference to an integer. If an error occurs, this integer is set to 1.
 *
 * Returns:
 * -> On failure:
 *    Return is undefined. err_flag will be set.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
template <typename T>
T fromNetworkOrder(T network_data, int& err_flag) {
    static_assert(std::is_unsigned_v<T>, "network ordering needs an unsigned type");
    if constexpr (sizeof(T) == sizeof(uint8_t))
        return network_data;
    else if constexpr (sizeof(T) == sizeof(uint16_t))
        return be16toh(network_data);
    else if constexpr (sizeof(T) == sizeof(uint32_t))
        return be32toh(network_data);
    else if constexpr (sizeof(T) == sizeof(uint64_t))
        return be64toh(network_data);

    err_flag = 1;
    return network_data;
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * getIpBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Takes a string representation of an IPv4 address (xxx.xxx.xxx.xxx), and
 *    converts it to a uint32_t in big-endian network ordering.
 *
 * Returns:
 * -> On success:
 *    The network ordered representation.
 * -> On failure:
 *    0
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
uint32_t getIpBytes(const std::string& ip_str);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ipBytesToString
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses the above, returning a string representation of the network-
 *    ordered IPv4 address.
 *
 * -> ip_bytes:
 *    A pointer to the start of the byte sequence that was recieved. 4-bytes
 *    will be read from this point. It's up to the caller to make sure this is
 *    defined.
 *
 * Returns:
 * -> On success:
 *    The string address.
 * -> On failure:
 *    An empty string.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string ipBytesToString(const uint8_t* ip_bytes);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * packBits
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Packs a chunk availability vector into a bitmap, 8 indices per byte with
 *    index 0 in the most significant bit of the first byte. Trailing bits of
 *    the last byte are zero.
 *
 * Returns:
 * -> ceil(bits.size() / 8) bytes.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> packBits(const std::vector<bool>& bits);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * unpackBits
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses packBits. Reads ceil(bit_count / 8) bytes from bitmap, the caller
 *    makes sure that many are defined.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<bool> unpackBits(const uint8_t* bitmap, size_t bit_count);

//bytes needed to hold bit_count packed bits
inline size_t bitmapLen(const size_t bit_count) {
    return (bit_count + 7) / 8;
}

} //csw
