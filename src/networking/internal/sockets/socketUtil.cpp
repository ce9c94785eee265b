#include "networking/internal/sockets/socketUtil.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"
#include "networking/socket.hpp"

#include <cerrno>
#include <cstring>
#include <cstdint>
#include <sys/socket.h>
#include <sys/types.h>
#include <vector>

namespace csw {

void msgLenToBytes(const uint64_t len, uint8_t* buffer) {
    int err_code = 0;
    uint64_t ordered = toNetworkOrder(len, err_code);
    std::memcpy(buffer, &ordered, sizeof(uint64_t));
}

uint64_t bytesToMsgLen(const std::vector<uint8_t>& buffer) {
    if (buffer.size() < sizeof(uint64_t))
        return 0;

    int err_code = 0;
    uint64_t ordered;
    std::memcpy(&ordered, buffer.data(), sizeof(ordered));
    return fromNetworkOrder(ordered, err_code);
}

ssize_t recvBytes(int                   socket_fd,
                  std::vector<uint8_t>& buffer,
                  size_t                try_to_recv,
                  timeval               timeout) {
    if (try_to_recv == 0)
        return -1;

    //a zero SO_RCVTIMEO blocks forever, so poll for the shortest wait instead
    if (timeout.tv_sec == 0 && timeout.tv_usec == 0)
        timeout.tv_usec = 1000;

    int ret = setsockopt(socket_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    if (ret < 0)
        return -1;

    size_t original_len = buffer.size();
    buffer.resize(original_len + try_to_recv);

    ssize_t bytes_read;
    do {
        bytes_read = recv(socket_fd, buffer.data()+original_len, try_to_recv, 0);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read > 0) {
        buffer.resize(original_len + bytes_read);
        return bytes_read;
    }

    buffer.resize(original_len);
    if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        return RECV_TIMED_OUT;
    return -1;
}

} //csw
