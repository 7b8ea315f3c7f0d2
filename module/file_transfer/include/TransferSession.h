/**
 * @file TransferSession.h
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
 * The TransferSession class holds the state of one file transfer
 * (identity, chunk geometry, received chunks, status and storage handles).
 * Each session owns its own mutex so that unrelated sessions never contend.
 * The immutable identity fields are set at construction; everything else
 * is accessed through the locking member functions.
 */

#ifndef TRANSFER_SESSION_H
#define TRANSFER_SESSION_H 1

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem/path.hpp>
#include "ContentDigest.h"
#include "file_transfer_lib_export.h"

enum class TRANSFER_SESSION_STATUS
{
    PENDING = 0,
    TRANSFERRING,
    COMPLETED,
    FAILED,
    EXPIRED
};

class TransferSession {
public:
    FILE_TRANSFER_LIB_EXPORT TransferSession(const std::string & sessionId, const std::string & filename, uint32_t chunkSize);
    FILE_TRANSFER_LIB_EXPORT ~TransferSession();
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    FILE_TRANSFER_LIB_EXPORT static const char * StatusToString(TRANSFER_SESSION_STATUS status);

    const std::string & GetSessionId() const { return M_SESSION_ID; }
    const std::string & GetFilename() const { return M_FILENAME; }
    uint32_t GetChunkSize() const { return M_CHUNK_SIZE; }

    FILE_TRANSFER_LIB_EXPORT void SetClientId(const std::string & clientId);
    FILE_TRANSFER_LIB_EXPORT std::string GetClientId() const;

    /// Sets size, chunk count and whole-file checksum once they are known
    FILE_TRANSFER_LIB_EXPORT void SetFileInfo(uint64_t fileSize, uint32_t totalChunks, const checksum_field_t & fileChecksum);
    FILE_TRANSFER_LIB_EXPORT uint64_t GetFileSize() const;
    FILE_TRANSFER_LIB_EXPORT uint32_t GetTotalChunks() const;
    FILE_TRANSFER_LIB_EXPORT checksum_field_t GetFileChecksum() const;

    FILE_TRANSFER_LIB_EXPORT TRANSFER_SESSION_STATUS GetStatus() const;
    FILE_TRANSFER_LIB_EXPORT void SetStatus(TRANSFER_SESSION_STATUS status);

    /** Record that a chunk is now stored.
     *
     * @param chunkNumber The chunk, must be below GetTotalChunks().
     * @return True if the chunk was newly recorded, or False if out of range or already present.
     */
    FILE_TRANSFER_LIB_EXPORT bool MarkChunkReceived(uint32_t chunkNumber);
    FILE_TRANSFER_LIB_EXPORT bool IsChunkReceived(uint32_t chunkNumber) const;
    FILE_TRANSFER_LIB_EXPORT std::size_t GetNumChunksReceived() const;
    FILE_TRANSFER_LIB_EXPORT bool AllChunksReceived() const;
    /// Lowest chunk number not yet received (GetTotalChunks() if none missing)
    FILE_TRANSFER_LIB_EXPORT uint32_t GetFirstMissingChunk() const;
    /// Fraction of chunks received in [0,1] (1 for a zero chunk transfer)
    FILE_TRANSFER_LIB_EXPORT double GetProgress() const;

    FILE_TRANSFER_LIB_EXPORT void SetTempFilePath(const boost::filesystem::path & p);
    FILE_TRANSFER_LIB_EXPORT boost::filesystem::path GetTempFilePath() const;
    FILE_TRANSFER_LIB_EXPORT void SetFinalFilePath(const boost::filesystem::path & p);
    FILE_TRANSFER_LIB_EXPORT boost::filesystem::path GetFinalFilePath() const;

    /// Takes ownership of an open descriptor (closing any previous one)
    FILE_TRANSFER_LIB_EXPORT void SetFileDescriptor(int fd);
    FILE_TRANSFER_LIB_EXPORT int GetFileDescriptor() const;
    /// Closes the descriptor if open
    FILE_TRANSFER_LIB_EXPORT void CloseFileDescriptor();

    FILE_TRANSFER_LIB_EXPORT void Touch();
    FILE_TRANSFER_LIB_EXPORT void SetLastActivity(const boost::posix_time::ptime & t);
    FILE_TRANSFER_LIB_EXPORT boost::posix_time::ptime GetLastActivity() const;

private:
    const std::string M_SESSION_ID;
    const std::string M_FILENAME;
    const uint32_t M_CHUNK_SIZE;

    mutable boost::mutex m_mutex;
    std::string m_clientId;
    uint64_t m_fileSize;
    uint32_t m_totalChunks;
    checksum_field_t m_fileChecksum;
    std::set<uint32_t> m_chunksReceived;
    TRANSFER_SESSION_STATUS m_status;
    boost::filesystem::path m_tempFilePath;
    boost::filesystem::path m_finalFilePath;
    int m_fd;
    boost::posix_time::ptime m_lastActivity;
};

typedef std::shared_ptr<TransferSession> TransferSession_ptr;

#endif //TRANSFER_SESSION_H
