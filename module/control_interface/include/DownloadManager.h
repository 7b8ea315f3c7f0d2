/**
 * @file DownloadManager.h
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
 * The DownloadManager class runs downloads requested through the control
 * interface on a background worker thread, one at a time, against a
 * configured remote CFTP server.  Each download is tracked by its local
 * filename as pending, downloading, completed or failed, with its fractional progress.
 */

#ifndef DOWNLOAD_MANAGER_H
#define DOWNLOAD_MANAGER_H 1

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <boost/filesystem/path.hpp>
#include <boost/thread.hpp>
#include "CftpProtocol.h"
#include "ContentDigest.h"
#include "JsonSerializable.h"
#include "control_interface_lib_export.h"

enum class DOWNLOAD_STATUS
{
    PENDING = 0,
    DOWNLOADING,
    COMPLETED,
    FAILED
};

struct download_progress_t : public JsonSerializable {
    std::string filename;
    DOWNLOAD_STATUS status;
    double progress; //[0,1]
    CFTP_ERROR_TYPE error;

    CONTROL_INTERFACE_LIB_EXPORT download_progress_t();
    CONTROL_INTERFACE_LIB_EXPORT static const char * StatusToString(DOWNLOAD_STATUS status);
    CONTROL_INTERFACE_LIB_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;
    CONTROL_INTERFACE_LIB_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override;
};

class DownloadManager {
public:
    CONTROL_INTERFACE_LIB_EXPORT DownloadManager(const boost::filesystem::path & saveDir,
        const boost::filesystem::path & tempDir,
        DIGEST_ALGORITHM digestAlgorithm = DIGEST_ALGORITHM::MD5);
    CONTROL_INTERFACE_LIB_EXPORT ~DownloadManager();
    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /// Start the worker thread
    CONTROL_INTERFACE_LIB_EXPORT void Start();
    /// Drop queued downloads and join the worker (a running download is allowed to finish).
    CONTROL_INTERFACE_LIB_EXPORT void Stop();

    CONTROL_INTERFACE_LIB_EXPORT void SetRemoteServer(const std::string & host, uint16_t port);
    CONTROL_INTERFACE_LIB_EXPORT std::string GetRemoteHost() const;
    CONTROL_INTERFACE_LIB_EXPORT uint16_t GetRemotePort() const;

    /** Queue a download; an empty localFilename means the remote name.
     *
     * @return False if the local name is unsafe or a download to it is already pending or running.
     */
    CONTROL_INTERFACE_LIB_EXPORT bool QueueDownload(const std::string & remoteFilename, const std::string & localFilename);

    /// Relative, with no ".." component
    CONTROL_INTERFACE_LIB_EXPORT static bool IsSafeLocalFilename(const std::string & localFilename);

    /// @return False if nothing is known about localFilename.
    CONTROL_INTERFACE_LIB_EXPORT bool GetProgress(const std::string & localFilename, download_progress_t & progress) const;

    /// Connect to the remote server and list its root directory.
    CONTROL_INTERFACE_LIB_EXPORT CFTP_ERROR_TYPE ListRemoteFiles(list_entry_vector_t & entries);

    /// Block until nothing is queued or running (or the timeout passes); returns true if idle.
    CONTROL_INTERFACE_LIB_EXPORT bool WaitUntilIdle(unsigned int timeoutMilliseconds);

private:
    struct download_request_t {
        std::string remoteFilename;
        std::string localFilename;
    };

    void WorkerThreadFunc();
    void RunDownload(const download_request_t & request);
    void OnDownloadProgress(const std::string & localFilename, double progress);
    void SetFinished(const std::string & localFilename, CFTP_ERROR_TYPE result);

private:
    const boost::filesystem::path M_SAVE_DIR;
    const boost::filesystem::path M_TEMP_DIR;
    const DIGEST_ALGORITHM M_DIGEST_ALGORITHM;

    mutable boost::mutex m_mutex;
    boost::condition_variable m_conditionVariable;
    std::deque<download_request_t> m_queue;
    std::map<std::string, download_progress_t> m_progressMap;
    std::string m_remoteHost;
    uint16_t m_remotePort;
    bool m_running;
    bool m_busy;
    std::unique_ptr<boost::thread> m_workerThreadPtr;
};

#endif //DOWNLOAD_MANAGER_H
