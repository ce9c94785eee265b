#pragma once

#include <cstdint>
#include <optional>
#include <sys/time.h>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace csw {

struct SourceInfo;

//returned by the recv functions when the timeout passed with nothing read
inline constexpr ssize_t RECV_TIMED_OUT = -2;

//largest framed message accepted, a chunk plus its header with room to spare
inline constexpr uint64_t MAX_MESSAGE_LEN = 64ull * 1024 * 1024;

//converts a millisecond count into a timeval for the socket calls
timeval toTimeval(uint64_t millis);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * openSocket
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Opens a TCP socket. A server socket is bound to port on all interfaces,
 *    with port 0 letting the OS assign an ephemeral port. A client socket is
 *    left unbound and the returned port is 0.
 *
 *    The tcp:: namespace functions should be used with it.
 *
 * Takes:
 * -> is_server
 *    A flag to indicate server socket.
 * -> port
 *    The port to open on, set to 0 if not specified.
 *
 * Returns:
 * -> On success:
 *    A pair of the socket fd and the port it was opened on.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::pair<int, uint16_t>> openSocket(bool     is_server,
                                                   uint16_t port=0);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * closeSocket
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Closes a socket.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void closeSocket(int socket_fd);

namespace tcp {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * connect
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Connect to a socket. Utilized by peers to either connect to the tracker,
 *    or connect to a fellow peer to exchange chunks.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to connect with.
 * -> connect_to:
 *    A struct with info on where to connect.
 * -> connection_timeout:
 *    How long to wait for the connection. std::nullopt blocks.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int connect(int                           socket_fd,
            const SourceInfo&             connect_to,
            const std::optional<timeval>& connection_timeout = std::nullopt);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * listen
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Start listen for incoming connections.
 *
 * Takes:
 * -> server_fd:
 *    The server socket to start listening on.
 * -> max_pending:
 *    The max connections that can be waiting to be accepted. Shouldn't need to
 *    be very high as every accepted connection is immediately handed off to a
 *    thread.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE, and server_fd is closed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int listen(int server_fd, int max_pending);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * accept
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Accept an incoming connection. With a timeout, waits at most that long
 *    for one to arrive so the caller can check a shutdown flag between calls.
 *
 * Takes:
 * -> server_fd:
 *    Server socket that's listening for an incoming connection.
 * -> client_info:
 *    Filled with the address of the connecting socket.
 * -> timeout:
 *    How long to wait. std::nullopt blocks.
 *
 * Returns:
 * -> On success:
 *    The socket file descriptor of the socket that was opened.
 * -> On timeout:
 *    RECV_TIMED_OUT
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int accept(int                           server_fd,
           SourceInfo&                   client_info,
           const std::optional<timeval>& timeout = std::nullopt);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sendMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Sends data through a socket, prefixed with its 8 byte length.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int sendMessage(int socket_fd, const std::vector<uint8_t>& data);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * recvMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads the next length prefixed message on the socket into buffer. Any
 *    data in buffer prior to this call is replaced.
 *
 *    Once the first header byte has arrived the whole message is read, and a
 *    stall partway through is a failure, since the stream can't be resynced.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to read the data from.
 * -> buffer:
 *    The container the message is stored in.
 * -> timeout:
 *    How long to wait for the message to start arriving. Reads after that
 *    wait at least 2 seconds each.
 *
 * Returns:
 * -> On success:
 *    The number of bytes read.
 * -> On timeout:
 *    RECV_TIMED_OUT, nothing was read.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t recvMessage(int                   socket_fd,
                    std::vector<uint8_t>& buffer,
                    timeval               timeout);

} //tcp

} //csw
