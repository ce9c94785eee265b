#include "peer/internal/internal/peerNetworking.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"

#include <cstdlib>
#include <iostream>

namespace csw {

int connectToSource(const SourceInfo& connect_to, timeval connection_timeout) {
    auto sock = openSocket(false, 0);
    if (!sock)
        return -1;

    if (EXIT_SUCCESS != tcp::connect(sock->first, connect_to, connection_timeout)) {
        closeSocket(sock->first);
        return -1;
    }

    return sock->first;
}

bool sendOkay(int sock, const std::vector<uint8_t>& message) {
    if (message.empty())
        return false;
    return tcp::sendMessage(sock, message) == EXIT_SUCCESS;
}

bool recvOkay(int                   sock,
              std::vector<uint8_t>& buffer,
              const uint8_t         expected_code,
              timeval               timeout) {
    ssize_t bytes_read = tcp::recvMessage(sock, buffer, timeout);
    if (bytes_read <= 0 || buffer.empty())
        return false;

    return buffer.front() == expected_code;
}

int sendAndRecv(int                         sock,
                const std::vector<uint8_t>& out,
                std::vector<uint8_t>&       in,
                const uint8_t               expected_code,
                timeval                     timeout) {
    if (!sendOkay(sock, out))
        return EXIT_FAILURE;

    if (!recvOkay(sock, in, expected_code, timeout))
        return EXIT_FAILURE;

    return EXIT_SUCCESS;
}

std::string failReason(const std::vector<uint8_t>& buffer) {
    if (buffer.empty())
        return "no reply";

    std::string reason = parseFailMessage(buffer);
    if (reason.empty())
        return "unexpected message code " + std::to_string(buffer.front());
    return reason;
}

} //csw
