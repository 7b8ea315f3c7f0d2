/**
 * @file SequentialTransferServer.h
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
 * The SequentialTransferServer class serves one connection at a time from a
 * single accept thread.  Clients that connect while another is being served
 * wait in the listen backlog.
 */

#ifndef SEQUENTIAL_TRANSFER_SERVER_H
#define SEQUENTIAL_TRANSFER_SERVER_H 1

#include <memory>
#include <boost/thread.hpp>
#include "TransferServerBase.h"

class SequentialTransferServer : public TransferServerBase {
public:
    TRANSFER_SERVER_LIB_EXPORT SequentialTransferServer();
    TRANSFER_SERVER_LIB_EXPORT virtual ~SequentialTransferServer() override;
    TRANSFER_SERVER_LIB_EXPORT virtual std::string GetServerType() const override;

protected:
    virtual bool StartBackend() override;
    virtual void StopBackend() override;

private:
    void AcceptLoopThreadFunc();

private:
    std::unique_ptr<boost::thread> m_acceptLoopThreadPtr;
};

#endif //SEQUENTIAL_TRANSFER_SERVER_H
