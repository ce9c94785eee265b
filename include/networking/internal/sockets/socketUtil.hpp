#pragma once

#include <cstdint>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * msgLenToBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Writes a message length as an 8 byte big-endian header into buffer. The
 *    caller makes sure 8 bytes are available.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void msgLenToBytes(const uint64_t val, uint8_t* buffer);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * bytesToMsgLen
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads an 8 byte big-endian header from the front of buffer.
 *
 * Returns:
 * -> The message length, or 0 if buffer is shorter than 8 bytes.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
uint64_t bytesToMsgLen(const std::vector<uint8_t>& buffer);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * recvBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads bytes on the socket into a buffer if it's present.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to read the data from.
 * -> buffer:
 *    The container to append the read bytes to.
 * -> try_to_recv:
 *    Bytes attempt to read.
 * -> timeout:
 *    How long this function waits for any bytes before giving up.
 *
 * Returns:
 * -> On success:
 *    The number of bytes read. May or may not be equal to try_to_recv.
 * -> On timeout:
 *    RECV_TIMED_OUT, nothing was appended.
 * -> On failure:
 *    -1, including an orderly close by the remote.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t recvBytes(int                   socket_fd,
                  std::vector<uint8_t>& buffer,
                  size_t                try_to_recv,
                  timeval               timeout);

} //csw
