/**
 * @file ConnectionHandler.h
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * This ConnectionHandler pure virtual base class is the contract between the
 * protocol state machines (server and client halves) and whatever schedules them.
 * A driver feeds received bytes in, drains the bytes to send, and closes the
 * socket once the handler is finished and nothing remains to be sent.
 * Handlers never touch a socket, so the same handler behaves identically
 * under every concurrency backend.
 */

#ifndef CONNECTION_HANDLER_H
#define CONNECTION_HANDLER_H 1

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "file_transfer_lib_export.h"

class ConnectionHandler {
public:
    FILE_TRANSFER_LIB_EXPORT virtual ~ConnectionHandler();

    /// Step the state machine with bytes read from the connection (any amount).
    virtual void HandleReceivedBytes(const uint8_t * data, std::size_t size) = 0;

    /** Take every byte queued for sending.
     *
     * @param bytesToSend Replaced by the queued bytes.
     * @return True if there was anything to send.
     */
    virtual bool TakeBytesToSend(std::vector<uint8_t> & bytesToSend) = 0;

    /// No further input will be processed; close once the queued bytes are sent.
    virtual bool IsFinished() const = 0;

    /// The connection is gone (peer close, read or write failure, or server stop).
    virtual void OnDisconnect() = 0;
};

typedef std::shared_ptr<ConnectionHandler> ConnectionHandler_ptr;

#endif //CONNECTION_HANDLER_H
