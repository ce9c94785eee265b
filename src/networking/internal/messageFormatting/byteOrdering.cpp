#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <sys/socket.h>

namespace csw {

uint32_t getIpBytes(const std::string& ip_str) {
    uint32_t ip_bytes;
    if (0 >= inet_pton(AF_INET, ip_str.c_str(), &ip_bytes))
        return 0;
    return ip_bytes;
}

std::string ipBytesToString(const uint8_t* ip_bytes) {
    char buff[INET_ADDRSTRLEN];
    uint32_t network_order_bytes;
    std::memcpy(&network_order_bytes, ip_bytes, sizeof(network_order_bytes));
    if (nullptr == inet_ntop(AF_INET, &network_order_bytes, buff, INET_ADDRSTRLEN))
        return "";
    return std::string(buff);
}

std::vector<uint8_t> packBits(const std::vector<bool>& bits) {
    std::vector<uint8_t> bitmap(bitmapLen(bits.size()), 0);
    for (size_t i = 0; i < bits.size(); ++i)
        if (bits[i])
            bitmap[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
    return bitmap;
}

std::vector<bool> unpackBits(const uint8_t* bitmap, size_t bit_count) {
    std::vector<bool> bits(bit_count, false);
    for (size_t i = 0; i < bit_count; ++i)
        bits[i] = (bitmap[i / 8] & (0x80 >> (i % 8))) != 0;
    return bits;
}

} //csw
