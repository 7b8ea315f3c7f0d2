/**
 * @file DownloadManager.cpp
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

#include "DownloadManager.h"
#include "TcpFileTransferClient.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::control;

static const std::string DOWNLOAD_MANAGER_CLIENT_ID = "cftp-download-manager";

download_progress_t::download_progress_t() :
    status(DOWNLOAD_STATUS::PENDING),
    progress(0.0),
    error(CFTP_ERROR_TYPE::NONE) {}

const char * download_progress_t::StatusToString(DOWNLOAD_STATUS status) {
    switch (status) {
        case DOWNLOAD_STATUS::PENDING: return "pending";
        case DOWNLOAD_STATUS::DOWNLOADING: return "downloading";
        case DOWNLOAD_STATUS::COMPLETED: return "completed";
        case DOWNLOAD_STATUS::FAILED: return "failed";
    }
    return "unknown";
}

boost::property_tree::ptree download_progress_t::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("filename", filename);
    pt.put("status", StatusToString(status));
    pt.put("progress", progress);
    if (error != CFTP_ERROR_TYPE::NONE) {
        pt.put("error", CftpProtocol::ErrorTypeToString(error));
    }
    return pt;
}

bool download_progress_t::SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
    try {
        filename = pt.get<std::string>("filename");
        const std::string statusStr = pt.get<std::string>("status");
        if (statusStr == "pending") status = DOWNLOAD_STATUS::PENDING;
        else if (statusStr == "downloading") status = DOWNLOAD_STATUS::DOWNLOADING;
        else if (statusStr == "completed") status = DOWNLOAD_STATUS::COMPLETED;
        else if (statusStr == "failed") status = DOWNLOAD_STATUS::FAILED;
        else {
            LOG_ERROR(subprocess) << "parsing JSON download progress: unknown status " << statusStr;
            return false;
        }
        progress = pt.get<double>("progress");
    }
    catch (const boost::property_tree::ptree_error & e) {
        LOG_ERROR(subprocess) << "parsing JSON download progress: " << e.what();
        return false;
    }
    return true;
}

DownloadManager::DownloadManager(const boost::filesystem::path & saveDir,
    const boost::filesystem::path & tempDir,
    DIGEST_ALGORITHM digestAlgorithm) :
    M_SAVE_DIR(saveDir),
    M_TEMP_DIR(tempDir),
    M_DIGEST_ALGORITHM(digestAlgorithm),
    m_remoteHost("localhost"),
    m_remotePort(8001),
    m_running(false),
    m_busy(false)
{
}

DownloadManager::~DownloadManager() {
    Stop();
}

void DownloadManager::Start() {
    boost::mutex::scoped_lock lock(m_mutex);
    if (m_workerThreadPtr) {
        return;
    }
    m_running = true;
    m_workerThreadPtr = boost::make_unique<boost::thread>(boost::bind(&DownloadManager::WorkerThreadFunc, this));
    ThreadNamer::SetThreadName(*m_workerThreadPtr, "downloadWorker");
}

void DownloadManager::Stop() {
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (!m_workerThreadPtr) {
            return;
        }
        m_running = false;
        for (std::deque<download_request_t>::const_iterator it = m_queue.begin(); it != m_queue.end(); ++it) {
            download_progress_t & p = m_progressMap[it->localFilename];
            p.status = DOWNLOAD_STATUS::FAILED;
            p.error = CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        m_queue.clear();
    }
    m_conditionVariable.notify_all();
    try {
        m_workerThreadPtr->join();
    }
    catch (const boost::thread_resource_error &) {
        LOG_ERROR(subprocess) << "error stopping DownloadManager worker thread";
    }
    m_workerThreadPtr.reset();
}

void DownloadManager::SetRemoteServer(const std::string & host, uint16_t port) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_remoteHost = host;
    m_remotePort = port;
}

std::string DownloadManager::GetRemoteHost() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_remoteHost;
}

uint16_t DownloadManager::GetRemotePort() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_remotePort;
}

bool DownloadManager::QueueDownload(const std::string & remoteFilename, const std::string & localFilename) {
    download_request_t request;
    request.remoteFilename = remoteFilename;
    request.localFilename = (localFilename.empty()) ? remoteFilename : localFilename;
    if (!IsSafeLocalFilename(request.localFilename)) {
        LOG_ERROR(subprocess) << "refusing to download to " << request.localFilename;
        return false;
    }
    {
        boost::mutex::scoped_lock lock(m_mutex);
        std::map<std::string, download_progress_t>::const_iterator it = m_progressMap.find(request.localFilename);
        if ((it != m_progressMap.cend())
            && ((it->second.status == DOWNLOAD_STATUS::PENDING) || (it->second.status == DOWNLOAD_STATUS::DOWNLOADING)))
        {
            LOG_WARNING(subprocess) << "a download to " << request.localFilename << " is already "
                << download_progress_t::StatusToString(it->second.status);
            return false;
        }
        download_progress_t progress;
        progress.filename = request.localFilename;
        m_progressMap[request.localFilename] = progress;
        m_queue.push_back(request);
    }
    LOG_INFO(subprocess) << "queued download of " << remoteFilename << " to " << request.localFilename;
    m_conditionVariable.notify_all();
    return true;
}

bool DownloadManager::IsSafeLocalFilename(const std::string & localFilename) {
    const boost::filesystem::path p(localFilename);
    if (localFilename.empty() || p.has_root_path()) {
        return false;
    }
    for (boost::filesystem::path::const_iterator it = p.begin(); it != p.end(); ++it) {
        if (*it == "..") {
            return false;
        }
    }
    return true;
}

bool DownloadManager::GetProgress(const std::string & localFilename, download_progress_t & progress) const {
    boost::mutex::scoped_lock lock(m_mutex);
    std::map<std::string, download_progress_t>::const_iterator it = m_progressMap.find(localFilename);
    if (it == m_progressMap.cend()) {
        return false;
    }
    progress = it->second;
    return true;
}

bool DownloadManager::WaitUntilIdle(unsigned int timeoutMilliseconds) {
    const boost::system_time deadline = boost::get_system_time() + boost::posix_time::milliseconds(timeoutMilliseconds);
    boost::mutex::scoped_lock lock(m_mutex);
    while (m_busy || (!m_queue.empty())) {
        if (!m_conditionVariable.timed_wait(lock, deadline)) {
            return (!m_busy) && m_queue.empty();
        }
    }
    return true;
}

CFTP_ERROR_TYPE DownloadManager::ListRemoteFiles(list_entry_vector_t & entries) {
    const std::string host = GetRemoteHost();
    const uint16_t port = GetRemotePort();
    TcpFileTransferClient client(M_SAVE_DIR, M_TEMP_DIR, M_DIGEST_ALGORITHM);
    if (!client.Connect(host, port, DOWNLOAD_MANAGER_CLIENT_ID)) {
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    const CFTP_ERROR_TYPE result = client.ListFiles(CFTP_LIST_FILTER::ALL, "", entries);
    if (client.IsConnected()) {
        client.Close();
    }
    return result;
}

void DownloadManager::WorkerThreadFunc() {
    while (true) {
        download_request_t request;
        {
            boost::mutex::scoped_lock lock(m_mutex);
            while (m_running && m_queue.empty()) {
                m_conditionVariable.wait(lock);
            }
            if (!m_running) {
                break;
            }
            request = m_queue.front();
            m_queue.pop_front();
            m_busy = true;
            m_progressMap[request.localFilename].status = DOWNLOAD_STATUS::DOWNLOADING;
        }
        RunDownload(request);
        {
            boost::mutex::scoped_lock lock(m_mutex);
            m_busy = false;
        }
        m_conditionVariable.notify_all();
    }
}

void DownloadManager::RunDownload(const download_request_t & request) {
    const std::string host = GetRemoteHost();
    const uint16_t port = GetRemotePort();
    TcpFileTransferClient client(M_SAVE_DIR, M_TEMP_DIR, M_DIGEST_ALGORITHM);
    if (!client.Init()) {
        SetFinished(request.localFilename, CFTP_ERROR_TYPE::RESOURCE_ERROR);
        return;
    }
    client.SetDownloadProgressCallback(boost::bind(&DownloadManager::OnDownloadProgress, this,
        request.localFilename, boost::placeholders::_2));
    if (!client.Connect(host, port, DOWNLOAD_MANAGER_CLIENT_ID)) {
        SetFinished(request.localFilename, CFTP_ERROR_TYPE::RESOURCE_ERROR);
        return;
    }
    const CFTP_ERROR_TYPE result = client.DownloadFile(request.remoteFilename, request.localFilename);
    if (client.IsConnected()) {
        client.Close();
    }
    SetFinished(request.localFilename, result);
}

void DownloadManager::OnDownloadProgress(const std::string & localFilename, double progress) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_progressMap[localFilename].progress = progress;
}

void DownloadManager::SetFinished(const std::string & localFilename, CFTP_ERROR_TYPE result) {
    boost::mutex::scoped_lock lock(m_mutex);
    download_progress_t & p = m_progressMap[localFilename];
    p.error = result;
    if (result == CFTP_ERROR_TYPE::NONE) {
        p.status = DOWNLOAD_STATUS::COMPLETED;
        p.progress = 1.0;
        LOG_INFO(subprocess) << "download of " << localFilename << " completed";
    }
    else {
        p.status = DOWNLOAD_STATUS::FAILED;
        LOG_ERROR(subprocess) << "download of " << localFilename << " failed: " << CftpProtocol::ErrorTypeToString(result);
    }
}
