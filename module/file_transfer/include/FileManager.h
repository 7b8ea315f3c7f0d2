/**
 * @file FileManager.h
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
 * The FileManager class performs all chunk-aligned storage operations of a transfer.
 * Serving side: it opens files confined to the root directory, reads chunks with
 * positional reads (pread) and caches whole-file digests by (path, size, mtime).
 * Receiving side: it creates a temp file per session named <sessionId>_<filename>
 * in the temp directory, writes chunks with positional writes (pwrite) so that
 * writers of distinct chunks never share a file offset, and finalizes a transfer by
 * verifying the whole-file digest before renaming the temp file to its final path.
 * It also lists directory entries (flat or recursive, set at construction).
 * All operations return a CFTP_ERROR_TYPE (NONE on success) and log their failures.
 */

#ifndef FILE_MANAGER_H
#define FILE_MANAGER_H 1

#include <cstdint>
#include <ctime>
#include <map>
#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>
#include <boost/thread/mutex.hpp>
#include "CftpProtocol.h"
#include "ContentDigest.h"
#include "SessionRegistry.h"
#include "TransferSession.h"
#include "file_transfer_lib_export.h"

class FileManager {
public:
    FILE_TRANSFER_LIB_EXPORT FileManager(SessionRegistry & sessionRegistry,
        const boost::filesystem::path & rootDir,
        const boost::filesystem::path & tempDir,
        DIGEST_ALGORITHM digestAlgorithm,
        bool listRecursive,
        bool preserveTempOnError);
    FILE_TRANSFER_LIB_EXPORT ~FileManager();
    FileManager(const FileManager&) = delete;
    FileManager& operator=(const FileManager&) = delete;

    /// Creates the root and temp directories if missing
    FILE_TRANSFER_LIB_EXPORT bool Init();

    FILE_TRANSFER_LIB_EXPORT const boost::filesystem::path & GetRootDir() const noexcept;
    FILE_TRANSFER_LIB_EXPORT const boost::filesystem::path & GetTempDir() const noexcept;
    FILE_TRANSFER_LIB_EXPORT DIGEST_ALGORITHM GetDigestAlgorithm() const noexcept;
    FILE_TRANSFER_LIB_EXPORT bool IsListRecursive() const noexcept;
    FILE_TRANSFER_LIB_EXPORT bool IsPreserveTempOnError() const noexcept;

    /** Map a request path onto the root directory.
     * Absolute paths and paths with a ".." component are rejected.
     *
     * @return True if the path stays within the root directory.
     */
    FILE_TRANSFER_LIB_EXPORT bool ResolvePathUnderRoot(const std::string & requestPath, boost::filesystem::path & resolvedPath) const;

    //serving side

    /** Open the session's file under the root directory and fill in its size, chunk count and digest.
     *
     * @return NONE, NOT_FOUND (missing, not a regular file, or outside the root) or RESOURCE_ERROR.
     */
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE OpenSourceFile(const TransferSession_ptr & session);

    /** Read one chunk of an opened source file.
     *
     * @return NONE, INVALID_RANGE or RESOURCE_ERROR.
     */
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE ReadChunk(const TransferSession_ptr & session, uint32_t chunkNumber, std::vector<uint8_t> & data);

    /// Upper bound on cached whole-file digests; the lowest path is evicted first
    static constexpr std::size_t MAX_CACHED_CHECKSUMS = 256;

    /// Whole-file digest, served from the cache while (size, mtime) are unchanged
    FILE_TRANSFER_LIB_EXPORT bool GetFileChecksum(const boost::filesystem::path & filePath, uint64_t fileSize,
        std::time_t mtime, checksum_field_t & checksum);
    FILE_TRANSFER_LIB_EXPORT std::size_t GetNumCachedChecksums() const;

    //receiving side

    /** Create the session's temp file sized to fileSize, or reopen the one it already has.
     * When resumeSourcePath is given and the session has no temp file yet, the partial
     * file is copied into the temp file and chunks [0, startChunk) are marked received.
     *
     * @return NONE, INVALID_RANGE or RESOURCE_ERROR.
     */
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE PrepareDownload(const TransferSession_ptr & session, uint64_t fileSize,
        const checksum_field_t & fileChecksum, const boost::filesystem::path & finalPath,
        const boost::filesystem::path & resumeSourcePath = boost::filesystem::path(), uint32_t startChunk = 0);

    /** Write one chunk at offset chunkNumber * chunkSize of the session's temp file.
     * Safe to call concurrently for distinct chunks of the same session.
     *
     * @return NONE, INVALID_RANGE (chunk outside [0, total_chunks) or wrong length) or RESOURCE_ERROR.
     */
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE WriteChunk(const TransferSession_ptr & session, uint32_t chunkNumber, const uint8_t * data, std::size_t size);
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE WriteChunk(const std::string & sessionId, uint32_t chunkNumber, const uint8_t * data, std::size_t size);

    /** Verify the whole-file digest and move the temp file to its final path.
     * On a digest mismatch the temp file and session are kept so the transfer stays resumable.
     *
     * @return NONE, PROTOCOL_ERROR (chunks missing), INTEGRITY_ERROR or RESOURCE_ERROR.
     */
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE Finalize(const TransferSession_ptr & session);
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE Finalize(const std::string & sessionId);

    /** Close the session's descriptor.  When transferFailed is set and temp files are
     * not preserved on error, the session's temp file is deleted.
     */
    FILE_TRANSFER_LIB_EXPORT void ReleaseSession(const TransferSession_ptr & session, bool transferFailed);

    /// Expired callback for the SessionRegistry (applies the temp file policy)
    FILE_TRANSFER_LIB_EXPORT void OnSessionExpired(const TransferSession_ptr & session);

    //listing

    /** List the entries of a directory under the root directory, sorted by name.
     *
     * @return NONE, NOT_FOUND or RESOURCE_ERROR.
     */
    FILE_TRANSFER_LIB_EXPORT CFTP_ERROR_TYPE List(const std::string & requestPath, CFTP_LIST_FILTER filter, list_entry_vector_t & entries) const;

private:
    void ForgetFileChecksum(const boost::filesystem::path & filePath);

    struct cached_checksum_t {
        uint64_t fileSize;
        std::time_t mtime;
        checksum_field_t checksum;
    };
    typedef std::map<std::string, cached_checksum_t> checksum_cache_map_t;

    SessionRegistry & m_sessionRegistryRef;
    const boost::filesystem::path M_ROOT_DIR;
    const boost::filesystem::path M_TEMP_DIR;
    const DIGEST_ALGORITHM M_DIGEST_ALGORITHM;
    const bool M_LIST_RECURSIVE;
    const bool M_PRESERVE_TEMP_ON_ERROR;

    mutable boost::mutex m_checksumCacheMutex;
    checksum_cache_map_t m_checksumCache;
};

#endif //FILE_MANAGER_H
