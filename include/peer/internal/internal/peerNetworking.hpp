#pragma once

#include "sourceInfo.hpp"

#include <cstdint>
#include <string>
#include <sys/time.h>
#include <vector>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * connectToSource
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Opens a socket and connects it to a peer or the tracker.
 *
 * Takes:
 * -> connect_to:
 *    Where to connect.
 * -> connection_timeout:
 *    How long to wait for the connection.
 *
 * Returns:
 * -> On success:
 *    The connected socket.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int connectToSource(const SourceInfo& connect_to, timeval connection_timeout);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sendOkay
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Sends a message, false if it couldn't be sent or message is empty, which
 *    is what every create function returns on failure.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool sendOkay(int sock, const std::vector<uint8_t>& message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * recvOkay
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Receives the next message into buffer and checks that it starts with
 *    expected_code.
 *
 * Takes:
 * -> sock:
 *    The connected socket.
 * -> buffer:
 *    Where to put the message. Holds whatever was received even when the code
 *    didn't match, so the caller can read a FAIL reason out of it.
 * -> expected_code:
 *    The message code wanted.
 * -> timeout:
 *    How long to wait.
 *
 * Returns:
 * -> true if a message with expected_code was received.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool recvOkay(int                   sock,
              std::vector<uint8_t>& buffer,
              const uint8_t         expected_code,
              timeval               timeout);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sendAndRecv
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> sendOkay() then recvOkay().
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int sendAndRecv(int                         sock,
                const std::vector<uint8_t>& out,
                std::vector<uint8_t>&       in,
                const uint8_t               expected_code,
                timeval                     timeout);

//reason carried by a FAIL message in buffer, or a stand in if it isn't one
std::string failReason(const std::vector<uint8_t>& buffer);

} //csw
