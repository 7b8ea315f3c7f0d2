/**
 * @file ControlApi.h
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
 * The ControlApi class maps HTTP control requests (method, target, JSON body)
 * onto the TransferServerController and the DownloadManager, and renders
 * their results as JSON.  It holds no socket, so ControlHttpServer is only a transport for it.
 *
 * Routes:
 *   GET  /server/status               server status
 *   POST /server/start                body: TransferServerConfig JSON
 *   POST /server/stop
 *   GET  /server/logs                 newest log records, oldest first
 *   GET  /files                       root listing of the remote server
 *   POST /download                    body: {"remoteFilename": "...", "localFilename": "..."}
 *   GET  /download/progress/<name>    progress of a download by local filename
 */

#ifndef CONTROL_API_H
#define CONTROL_API_H 1

#include <string>
#include <boost/property_tree/ptree.hpp>
#include "TransferServerController.h"
#include "DownloadManager.h"
#include "control_interface_lib_export.h"

struct control_api_response_t {
    unsigned int statusCode;
    std::string jsonBody;

    CONTROL_INTERFACE_LIB_EXPORT control_api_response_t();
    CONTROL_INTERFACE_LIB_EXPORT control_api_response_t(unsigned int paramStatusCode, const std::string & paramJsonBody);
};

class ControlApi {
public:
    CONTROL_INTERFACE_LIB_EXPORT ControlApi(TransferServerController & serverController, DownloadManager & downloadManager);

    /// @param target The request target, with an optional query string (ignored).
    CONTROL_INTERFACE_LIB_EXPORT control_api_response_t HandleRequest(const std::string & method, const std::string & target, const std::string & body);

    /// {"error": message} with the given status code
    CONTROL_INTERFACE_LIB_EXPORT static control_api_response_t ErrorResponse(unsigned int statusCode, const std::string & message);
    /// Decodes %XX escapes and '+'; returns false on a malformed escape
    CONTROL_INTERFACE_LIB_EXPORT static bool PercentDecode(const std::string & in, std::string & out);

private:
    control_api_response_t GetServerStatus();
    control_api_response_t StartServer(const std::string & body);
    control_api_response_t StopServer();
    control_api_response_t GetLogs();
    control_api_response_t ListFiles();
    control_api_response_t StartDownload(const std::string & body);
    control_api_response_t GetDownloadProgress(const std::string & encodedName);

private:
    TransferServerController & m_serverControllerRef;
    DownloadManager & m_downloadManagerRef;
};

#endif //CONTROL_API_H
