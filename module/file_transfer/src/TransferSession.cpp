/**
 * @file TransferSession.cpp
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

#include "TransferSession.h"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <unistd.h>

TransferSession::TransferSession(const std::string & sessionId, const std::string & filename, uint32_t chunkSize) :
    M_SESSION_ID(sessionId),
    M_FILENAME(filename),
    M_CHUNK_SIZE(chunkSize),
    m_fileSize(0),
    m_totalChunks(0),
    m_status(TRANSFER_SESSION_STATUS::PENDING),
    m_fd(-1),
    m_lastActivity(boost::posix_time::microsec_clock::universal_time())
{
    m_fileChecksum.fill(0);
}

TransferSession::~TransferSession() {
    CloseFileDescriptor();
}

const char * TransferSession::StatusToString(TRANSFER_SESSION_STATUS status) {
    switch (status) {
        case TRANSFER_SESSION_STATUS::PENDING: return "pending";
        case TRANSFER_SESSION_STATUS::TRANSFERRING: return "transferring";
        case TRANSFER_SESSION_STATUS::COMPLETED: return "completed";
        case TRANSFER_SESSION_STATUS::FAILED: return "failed";
        case TRANSFER_SESSION_STATUS::EXPIRED: return "expired";
    }
    return "unknown";
}

void TransferSession::SetClientId(const std::string & clientId) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_clientId = clientId;
}
std::string TransferSession::GetClientId() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_clientId;
}

void TransferSession::SetFileInfo(uint64_t fileSize, uint32_t totalChunks, const checksum_field_t & fileChecksum) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_fileSize = fileSize;
    m_totalChunks = totalChunks;
    m_fileChecksum = fileChecksum;
    //drop anything outside the (possibly new) range
    m_chunksReceived.erase(m_chunksReceived.lower_bound(totalChunks), m_chunksReceived.end());
}
uint64_t TransferSession::GetFileSize() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_fileSize;
}
uint32_t TransferSession::GetTotalChunks() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_totalChunks;
}
checksum_field_t TransferSession::GetFileChecksum() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_fileChecksum;
}

TRANSFER_SESSION_STATUS TransferSession::GetStatus() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_status;
}
void TransferSession::SetStatus(TRANSFER_SESSION_STATUS status) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_status = status;
}

bool TransferSession::MarkChunkReceived(uint32_t chunkNumber) {
    boost::mutex::scoped_lock lock(m_mutex);
    if (chunkNumber >= m_totalChunks) {
        return false;
    }
    return m_chunksReceived.insert(chunkNumber).second;
}
bool TransferSession::IsChunkReceived(uint32_t chunkNumber) const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_chunksReceived.count(chunkNumber) != 0;
}
std::size_t TransferSession::GetNumChunksReceived() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_chunksReceived.size();
}
bool TransferSession::AllChunksReceived() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_chunksReceived.size() == m_totalChunks;
}
uint32_t TransferSession::GetFirstMissingChunk() const {
    boost::mutex::scoped_lock lock(m_mutex);
    uint32_t expected = 0;
    for (std::set<uint32_t>::const_iterator it = m_chunksReceived.cbegin(); it != m_chunksReceived.cend(); ++it) {
        if (*it != expected) {
            break;
        }
        ++expected;
    }
    return expected;
}
double TransferSession::GetProgress() const {
    boost::mutex::scoped_lock lock(m_mutex);
    if (m_totalChunks == 0) {
        return (m_status == TRANSFER_SESSION_STATUS::COMPLETED) ? 1.0 : 0.0;
    }
    return static_cast<double>(m_chunksReceived.size()) / static_cast<double>(m_totalChunks);
}

void TransferSession::SetTempFilePath(const boost::filesystem::path & p) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_tempFilePath = p;
}
boost::filesystem::path TransferSession::GetTempFilePath() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_tempFilePath;
}
void TransferSession::SetFinalFilePath(const boost::filesystem::path & p) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_finalFilePath = p;
}
boost::filesystem::path TransferSession::GetFinalFilePath() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_finalFilePath;
}

void TransferSession::SetFileDescriptor(int fd) {
    boost::mutex::scoped_lock lock(m_mutex);
    if ((m_fd >= 0) && (m_fd != fd)) {
        close(m_fd);
    }
    m_fd = fd;
}
int TransferSession::GetFileDescriptor() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_fd;
}
void TransferSession::CloseFileDescriptor() {
    boost::mutex::scoped_lock lock(m_mutex);
    if (m_fd >= 0) {
        close(m_fd);
        m_fd = -1;
    }
}

void TransferSession::Touch() {
    SetLastActivity(boost::posix_time::microsec_clock::universal_time());
}
void TransferSession::SetLastActivity(const boost::posix_time::ptime & t) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_lastActivity = t;
}
boost::posix_time::ptime TransferSession::GetLastActivity() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_lastActivity;
}
