/**
 * @file ControlApi.cpp
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "ControlApi.h"
#include "Logger.h"
#include "TransferServerConfig.h"
#include "JsonSerializable.h"
#include <boost/algorithm/string/predicate.hpp>
#include <cctype>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::control;

static const std::string DOWNLOAD_PROGRESS_PREFIX = "/download/progress/";

//property_tree writes an empty array as "", so empty lists are written by hand
static std::string ArrayResponseBody(const std::string & key, const boost::property_tree::ptree & arrayPt) {
    if (arrayPt.empty()) {
        return "{\n    \"" + key + "\": []\n}\n";
    }
    boost::property_tree::ptree pt;
    pt.add_child(key, arrayPt);
    return JsonSerializable::PtToJsonString(pt);
}

control_api_response_t::control_api_response_t() : statusCode(200) {}
control_api_response_t::control_api_response_t(unsigned int paramStatusCode, const std::string & paramJsonBody) :
    statusCode(paramStatusCode), jsonBody(paramJsonBody) {}

ControlApi::ControlApi(TransferServerController & serverController, DownloadManager & downloadManager) :
    m_serverControllerRef(serverController),
    m_downloadManagerRef(downloadManager)
{
}

control_api_response_t ControlApi::ErrorResponse(unsigned int statusCode, const std::string & message) {
    boost::property_tree::ptree pt;
    pt.put("error", message);
    return control_api_response_t(statusCode, JsonSerializable::PtToJsonString(pt));
}

bool ControlApi::PercentDecode(const std::string & in, std::string & out) {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%') {
            if (((i + 2) >= in.size()) || (!std::isxdigit(static_cast<unsigned char>(in[i + 1])))
                || (!std::isxdigit(static_cast<unsigned char>(in[i + 2]))))
            {
                return false;
            }
            out.push_back(static_cast<char>(std::stoi(in.substr(i + 1, 2), NULL, 16)));
            i += 2;
        }
        else if (c == '+') {
            out.push_back(' ');
        }
        else {
            out.push_back(c);
        }
    }
    return true;
}

control_api_response_t ControlApi::HandleRequest(const std::string & method, const std::string & target, const std::string & body) {
    const std::string path = target.substr(0, target.find('?'));
    LOG_DEBUG(subprocess) << method << " " << path;
    const bool isGet = (method == "GET");
    const bool isPost = (method == "POST");

    if (path == "/server/status") {
        return (isGet) ? GetServerStatus() : ErrorResponse(405, "use GET");
    }
    else if (path == "/server/start") {
        return (isPost) ? StartServer(body) : ErrorResponse(405, "use POST");
    }
    else if (path == "/server/stop") {
        return (isPost) ? StopServer() : ErrorResponse(405, "use POST");
    }
    else if (path == "/server/logs") {
        return (isGet) ? GetLogs() : ErrorResponse(405, "use GET");
    }
    else if (path == "/files") {
        return (isGet) ? ListFiles() : ErrorResponse(405, "use GET");
    }
    else if (path == "/download") {
        return (isPost) ? StartDownload(body) : ErrorResponse(405, "use POST");
    }
    else if (boost::algorithm::starts_with(path, DOWNLOAD_PROGRESS_PREFIX)) {
        return (isGet) ? GetDownloadProgress(path.substr(DOWNLOAD_PROGRESS_PREFIX.size())) : ErrorResponse(405, "use GET");
    }
    return ErrorResponse(404, "no route for " + path);
}

control_api_response_t ControlApi::GetServerStatus() {
    return control_api_response_t(200, m_serverControllerRef.GetStatus().ToJson());
}

control_api_response_t ControlApi::StartServer(const std::string & body) {
    if (m_serverControllerRef.IsRunning()) {
        return ErrorResponse(400, "server already running");
    }
    TransferServerConfig_ptr configPtr = TransferServerConfig::CreateFromJson((body.empty()) ? std::string("{}") : body, true);
    if (!configPtr) {
        return ErrorResponse(400, "invalid server configuration");
    }
    const SERVER_START_RESULT result = m_serverControllerRef.Start(*configPtr);
    if (result == SERVER_START_RESULT::ALREADY_RUNNING) {
        return ErrorResponse(400, TransferServerController::StartResultToString(result));
    }
    else if (result == SERVER_START_RESULT::INVALID_CONFIG) {
        return ErrorResponse(400, TransferServerController::StartResultToString(result));
    }
    else if (result != SERVER_START_RESULT::STARTED) {
        return ErrorResponse(500, TransferServerController::StartResultToString(result));
    }
    const server_status_t status = m_serverControllerRef.GetStatus();
    //downloads and listings go to the server this interface just started
    m_downloadManagerRef.SetRemoteServer((status.host == "0.0.0.0") ? std::string("127.0.0.1") : status.host, status.port);
    LOG_INFO(subprocess) << "started " << status.serverType << " server on port " << status.port << " by control request";
    return control_api_response_t(200, status.ToJson());
}

control_api_response_t ControlApi::StopServer() {
    if (!m_serverControllerRef.Stop()) {
        return ErrorResponse(400, "server not running");
    }
    LOG_INFO(subprocess) << "stopped server by control request";
    return control_api_response_t(200, m_serverControllerRef.GetStatus().ToJson());
}

control_api_response_t ControlApi::GetLogs() {
    const cftp::log_tail_entry_vector_t entries = cftp::Logger::GetRecentLogEntries();
    boost::property_tree::ptree logsPt;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        boost::property_tree::ptree entryPt;
        entryPt.put("timestamp", entries[i].timestamp);
        entryPt.put("level", entries[i].level);
        entryPt.put("module", entries[i].module);
        entryPt.put("message", entries[i].message);
        logsPt.push_back(std::make_pair("", entryPt));
    }
    return control_api_response_t(200, ArrayResponseBody("logs", logsPt));
}

control_api_response_t ControlApi::ListFiles() {
    list_entry_vector_t entries;
    const CFTP_ERROR_TYPE result = m_downloadManagerRef.ListRemoteFiles(entries);
    if (result != CFTP_ERROR_TYPE::NONE) {
        return ErrorResponse(502, std::string("listing failed: ") + CftpProtocol::ErrorTypeToString(result));
    }
    boost::property_tree::ptree filesPt;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        boost::property_tree::ptree entryPt;
        entryPt.put("name", entries[i].name);
        entryPt.put("size", entries[i].size);
        entryPt.put("mtime", entries[i].mtimeUnixSeconds);
        entryPt.put("isDirectory", entries[i].isDirectory);
        filesPt.push_back(std::make_pair("", entryPt));
    }
    return control_api_response_t(200, ArrayResponseBody("files", filesPt));
}

control_api_response_t ControlApi::StartDownload(const std::string & body) {
    boost::property_tree::ptree pt;
    if (!JsonSerializable::GetPropertyTreeFromJsonString(body, pt)) {
        return ErrorResponse(400, "body is not valid JSON");
    }
    const std::string remoteFilename = pt.get<std::string>("remoteFilename", "");
    std::string localFilename = pt.get<std::string>("localFilename", "");
    if (remoteFilename.empty()) {
        return ErrorResponse(400, "remoteFilename is required");
    }
    if (localFilename.empty()) {
        localFilename = remoteFilename;
    }
    if (!DownloadManager::IsSafeLocalFilename(localFilename)) {
        return ErrorResponse(400, "localFilename must be a relative path without ..");
    }
    if (!m_downloadManagerRef.QueueDownload(remoteFilename, localFilename)) {
        return ErrorResponse(409, "a download to " + localFilename + " is already in progress");
    }
    download_progress_t progress;
    m_downloadManagerRef.GetProgress(localFilename, progress);
    return control_api_response_t(202, progress.ToJson());
}

control_api_response_t ControlApi::GetDownloadProgress(const std::string & encodedName) {
    std::string localFilename;
    if (!PercentDecode(encodedName, localFilename)) {
        return ErrorResponse(400, "malformed download name");
    }
    download_progress_t progress;
    if (!m_downloadManagerRef.GetProgress(localFilename, progress)) {
        return ErrorResponse(404, "no download named " + localFilename);
    }
    return control_api_response_t(200, progress.ToJson());
}
