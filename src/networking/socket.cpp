#include "networking/socket.hpp"
#include "networking/internal/sockets/socketUtil.hpp"
#include "sourceInfo.hpp"

#include <cerrno>
#include <cstring>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <vector>
#include <unistd.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <fcntl.h>

namespace csw {

timeval toTimeval(uint64_t millis) {
    timeval tv;
    tv.tv_sec  = static_cast<time_t>(millis / 1000);
    tv.tv_usec = static_cast<suseconds_t>((millis % 1000) * 1000);
    return tv;
}

//SHARED UTIL
std::optional<std::pair<int, uint16_t>> openSocket(bool is_server, uint16_t port) {
    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0)
        return std::nullopt;

    if (is_server) {
        int reuse = 1;
        setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        struct sockaddr_in localAddr;
        memset(&localAddr, 0, sizeof(localAddr));

        localAddr.sin_family      = AF_INET;
        localAddr.sin_port        = htons(port);
        localAddr.sin_addr.s_addr = INADDR_ANY;

        if (bind(socket_fd, (struct sockaddr*)&localAddr, sizeof(localAddr)) < 0) {
            std::cerr << "[openSocket] Could not bind port " << port << ": "
                      << std::strerror(errno) << std::endl;
            close(socket_fd);
            return std::nullopt;
        }

        socklen_t socket_len = sizeof(localAddr);
        if (getsockname(socket_fd, (struct sockaddr*)&localAddr, &socket_len) < 0) {
            close(socket_fd);
            return std::nullopt;
        }

        port = ntohs(localAddr.sin_port);
    } else {
        port = 0;
    }

    return std::make_pair(socket_fd, port);
}

void closeSocket(int socket_fd) {
    close(socket_fd);
}

namespace tcp {

//floor on the per read timeout once a message is partway in
static constexpr time_t MIN_REST_TIMEOUT_SEC = 2;

//TCP UTIL
int connect(int                           socket_fd,
            const SourceInfo&             connect_to,
            const std::optional<timeval>& connection_timeout) {
    struct sockaddr_in server_address;
    memset(&server_address, 0, sizeof(server_address));

    server_address.sin_family = AF_INET;
    server_address.sin_port   = htons(connect_to.port);
    if (inet_pton(AF_INET, connect_to.ip_addr.c_str(), &server_address.sin_addr) != 1)
        return -1;

    if (!connection_timeout) {
        //blocking connect
        if (::connect(socket_fd, (struct sockaddr*)&server_address, sizeof(server_address)) < 0)
            return -1;
        return EXIT_SUCCESS;
    }

    timeval timeout = connection_timeout.value();

    //set non-block
    const int flags = fcntl(socket_fd, F_GETFL);
    if (flags < 0 || fcntl(socket_fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return -1;

    bool connect_okay = true;
    int res = ::connect(socket_fd, (struct sockaddr*)&server_address, sizeof(server_address));
    if (res < 0 && errno != EINPROGRESS) {
        connect_okay = false;
    } else if (res < 0) {
        fd_set fdset;
        FD_ZERO(&fdset);
        FD_SET(socket_fd, &fdset);

        res = select(socket_fd+1, NULL, &fdset, NULL, &timeout);
        if (res == 1) {
            //socket writable
            int so_err = 0;
            socklen_t len = sizeof(so_err);
            if (getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &so_err, &len) < 0 || so_err != 0)
                connect_okay = false;
        } else {
            //timeout or other error
            connect_okay = false;
        }
    }

    if (fcntl(socket_fd, F_SETFL, flags) < 0)
        connect_okay = false;

    if (!connect_okay)
        return -1;
    return EXIT_SUCCESS;
}

int listen(int server_fd, int max_pending) {
    if (::listen(server_fd, max_pending) < 0) {
        close(server_fd);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int accept(int                           server_fd,
           SourceInfo&                   client_info,
           const std::optional<timeval>& timeout) {
    if (timeout) {
        timeval wait_for = timeout.value();
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(server_fd, &read_fds);

        int ready = select(server_fd+1, &read_fds, NULL, NULL, &wait_for);
        if (ready == 0 || (ready < 0 && errno == EINTR))
            return RECV_TIMED_OUT;
        if (ready < 0)
            return -1;
    }

    struct sockaddr_in clientAddr;
    socklen_t client_len = sizeof(clientAddr);
    memset(&clientAddr, 0, client_len);

    int client_fd = ::accept(server_fd, (struct sockaddr*)&clientAddr, &client_len);
    if (client_fd < 0)
        return -1;

    char client_ip[INET_ADDRSTRLEN];
    if (nullptr == inet_ntop(AF_INET, &clientAddr.sin_addr, client_ip, INET_ADDRSTRLEN)) {
        close(client_fd);
        return -1;
    }
    client_info.ip_addr = client_ip;
    client_info.port    = ntohs(clientAddr.sin_port);

    return client_fd;
}

int sendMessage(int socket_fd, const std::vector<uint8_t>& data) {
    uint64_t data_len = data.size();
    if (data_len == 0 || data_len > MAX_MESSAGE_LEN)
        return EXIT_FAILURE;

    std::vector<uint8_t> data_msg(sizeof(uint64_t) + data.size());
    msgLenToBytes(data_len, data_msg.data());
    std::memcpy(data_msg.data()+sizeof(uint64_t), data.data(), data.size());

    size_t sent = 0;
    while (sent < data_msg.size()) {
        ssize_t bytes_sent = send(socket_fd, data_msg.data()+sent, data_msg.size()-sent, MSG_NOSIGNAL);
        if (bytes_sent < 0 && errno == EINTR)
            continue;
        if (bytes_sent <= 0)
            return EXIT_FAILURE;
        sent += bytes_sent;
    }

    return EXIT_SUCCESS;
}

ssize_t recvMessage(int                   socket_fd,
                    std::vector<uint8_t>& buffer,
                    timeval               timeout) {
    buffer.clear();

    //once a message has started arriving, short poll timeouts shouldn't cut it off
    timeval rest_timeout = timeout;
    if (rest_timeout.tv_sec < MIN_REST_TIMEOUT_SEC) {
        rest_timeout.tv_sec  = MIN_REST_TIMEOUT_SEC;
        rest_timeout.tv_usec = 0;
    }

    std::vector<uint8_t> header;
    while (header.size() < sizeof(uint64_t)) {
        timeval wait_for = header.empty() ? timeout : rest_timeout;
        ssize_t header_read = recvBytes(socket_fd, header, sizeof(uint64_t) - header.size(), wait_for);
        if (header_read == RECV_TIMED_OUT && header.empty())
            return RECV_TIMED_OUT;
        if (header_read < 0)
            return -1;
    }

    uint64_t data_len = bytesToMsgLen(header);
    if (data_len == 0 || data_len > MAX_MESSAGE_LEN) {
        std::cerr << "[recvMessage] Bad message length " << data_len << std::endl;
        return -1;
    }

    buffer.reserve(data_len);
    while (buffer.size() < data_len) {
        ssize_t bytes_read = recvBytes(socket_fd, buffer, data_len - buffer.size(), rest_timeout);
        if (bytes_read < 0) {
            buffer.clear();
            return -1;
        }
    }

    return static_cast<ssize_t>(buffer.size());
}

} //tcp

} //csw
