/**
 * @file FileManager.cpp
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

#include "FileManager.h"
#include "Logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <boost/filesystem.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::filemanager;

constexpr std::size_t FileManager::MAX_CACHED_CHECKSUMS;

FileManager::FileManager(SessionRegistry & sessionRegistry,
    const boost::filesystem::path & rootDir,
    const boost::filesystem::path & tempDir,
    DIGEST_ALGORITHM digestAlgorithm,
    bool listRecursive,
    bool preserveTempOnError) :
    m_sessionRegistryRef(sessionRegistry),
    M_ROOT_DIR(rootDir),
    M_TEMP_DIR(tempDir),
    M_DIGEST_ALGORITHM(digestAlgorithm),
    M_LIST_RECURSIVE(listRecursive),
    M_PRESERVE_TEMP_ON_ERROR(preserveTempOnError) {}

FileManager::~FileManager() {}

bool FileManager::Init() {
    try {
        boost::filesystem::create_directories(M_ROOT_DIR);
        boost::filesystem::create_directories(M_TEMP_DIR);
    }
    catch (const boost::filesystem::filesystem_error & e) {
        LOG_ERROR(subprocess) << "cannot create storage directories: " << e.what();
        return false;
    }
    LOG_INFO(subprocess) << "root dir " << M_ROOT_DIR << ", temp dir " << M_TEMP_DIR
        << ", digest " << ContentDigest::AlgorithmToString(M_DIGEST_ALGORITHM)
        << ", list " << (M_LIST_RECURSIVE ? "recursive" : "flat")
        << ", temp files " << (M_PRESERVE_TEMP_ON_ERROR ? "preserved" : "discarded") << " on error";
    return true;
}

const boost::filesystem::path & FileManager::GetRootDir() const noexcept {
    return M_ROOT_DIR;
}
const boost::filesystem::path & FileManager::GetTempDir() const noexcept {
    return M_TEMP_DIR;
}
DIGEST_ALGORITHM FileManager::GetDigestAlgorithm() const noexcept {
    return M_DIGEST_ALGORITHM;
}
bool FileManager::IsListRecursive() const noexcept {
    return M_LIST_RECURSIVE;
}
bool FileManager::IsPreserveTempOnError() const noexcept {
    return M_PRESERVE_TEMP_ON_ERROR;
}

bool FileManager::ResolvePathUnderRoot(const std::string & requestPath, boost::filesystem::path & resolvedPath) const {
    const boost::filesystem::path requested(requestPath);
    if (requested.has_root_path()) {
        LOG_WARNING(subprocess) << "rejecting absolute path " << requestPath;
        return false;
    }
    for (boost::filesystem::path::const_iterator it = requested.begin(); it != requested.end(); ++it) {
        if (*it == "..") {
            LOG_WARNING(subprocess) << "rejecting path outside root: " << requestPath;
            return false;
        }
    }
    resolvedPath = M_ROOT_DIR / requested;
    return true;
}

CFTP_ERROR_TYPE FileManager::OpenSourceFile(const TransferSession_ptr & session) {
    boost::filesystem::path filePath;
    if (!ResolvePathUnderRoot(session->GetFilename(), filePath)) {
        return CFTP_ERROR_TYPE::NOT_FOUND;
    }
    const int fd = open(filePath.c_str(), O_RDONLY);
    if (fd < 0) {
        const int openErrno = errno;
        LOG_INFO(subprocess) << "cannot open " << filePath << ": " << strerror(openErrno);
        if (openErrno == ENOENT || openErrno == ENOTDIR) {
            ForgetFileChecksum(filePath);
            return CFTP_ERROR_TYPE::NOT_FOUND;
        }
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    session->SetFileDescriptor(fd); //session owns it from here on
    struct stat st;
    if (fstat(fd, &st) != 0) {
        LOG_ERROR(subprocess) << "cannot stat " << filePath << ": " << strerror(errno);
        session->CloseFileDescriptor();
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    if (!S_ISREG(st.st_mode)) {
        LOG_INFO(subprocess) << filePath << " is not a regular file";
        session->CloseFileDescriptor();
        return CFTP_ERROR_TYPE::NOT_FOUND;
    }
    const uint64_t fileSize = static_cast<uint64_t>(st.st_size);
    checksum_field_t checksum;
    if (!GetFileChecksum(filePath, fileSize, st.st_mtime, checksum)) {
        session->CloseFileDescriptor();
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    session->SetFileInfo(fileSize, CftpProtocol::GetTotalChunks(fileSize, session->GetChunkSize()), checksum);
    session->SetFinalFilePath(filePath);
    session->Touch();
    return CFTP_ERROR_TYPE::NONE;
}

CFTP_ERROR_TYPE FileManager::ReadChunk(const TransferSession_ptr & session, uint32_t chunkNumber, std::vector<uint8_t> & data) {
    const uint64_t fileSize = session->GetFileSize();
    const uint32_t chunkSize = session->GetChunkSize();
    if (chunkNumber >= session->GetTotalChunks()) {
        LOG_ERROR(subprocess) << "read of chunk " << chunkNumber << " outside [0," << session->GetTotalChunks() << ")";
        return CFTP_ERROR_TYPE::INVALID_RANGE;
    }
    const int fd = session->GetFileDescriptor();
    if (fd < 0) {
        LOG_ERROR(subprocess) << "session " << session->GetSessionId() << " has no open file";
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    const std::size_t length = CftpProtocol::GetChunkLength(fileSize, chunkSize, chunkNumber);
    const off_t offset = static_cast<off_t>(static_cast<uint64_t>(chunkNumber) * chunkSize);
    data.resize(length);
    std::size_t totalRead = 0;
    while (totalRead < length) {
        const ssize_t n = pread(fd, &data[totalRead], length - totalRead, offset + static_cast<off_t>(totalRead));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(subprocess) << "pread failed on chunk " << chunkNumber << " of " << session->GetFilename() << ": " << strerror(errno);
            return CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        if (n == 0) {
            LOG_ERROR(subprocess) << session->GetFilename() << " shrank while being served (chunk " << chunkNumber << ")";
            return CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        totalRead += static_cast<std::size_t>(n);
    }
    session->Touch();
    return CFTP_ERROR_TYPE::NONE;
}

bool FileManager::GetFileChecksum(const boost::filesystem::path & filePath, uint64_t fileSize,
    std::time_t mtime, checksum_field_t & checksum)
{
    const std::string key = filePath.string();
    {
        boost::mutex::scoped_lock lock(m_checksumCacheMutex);
        checksum_cache_map_t::iterator it = m_checksumCache.find(key);
        if (it != m_checksumCache.end()) {
            if ((it->second.fileSize == fileSize) && (it->second.mtime == mtime)) {
                checksum = it->second.checksum;
                return true;
            }
            m_checksumCache.erase(it); //file changed since it was cached
        }
    }
    //digest computed without holding the cache lock
    ContentDigest digest(M_DIGEST_ALGORITHM);
    if (!digest.ComputeFile(filePath, checksum)) {
        return false;
    }
    cached_checksum_t entry;
    entry.fileSize = fileSize;
    entry.mtime = mtime;
    entry.checksum = checksum;
    {
        boost::mutex::scoped_lock lock(m_checksumCacheMutex);
        if ((m_checksumCache.size() >= MAX_CACHED_CHECKSUMS) && (m_checksumCache.count(key) == 0)) {
            m_checksumCache.erase(m_checksumCache.begin());
        }
        m_checksumCache[key] = entry;
    }
    LOG_DEBUG(subprocess) << "digest of " << filePath << " is " << ContentDigest::ToHexString(checksum, digest.GetDigestSize());
    return true;
}

void FileManager::ForgetFileChecksum(const boost::filesystem::path & filePath) {
    boost::mutex::scoped_lock lock(m_checksumCacheMutex);
    m_checksumCache.erase(filePath.string());
}

std::size_t FileManager::GetNumCachedChecksums() const {
    boost::mutex::scoped_lock lock(m_checksumCacheMutex);
    return m_checksumCache.size();
}

CFTP_ERROR_TYPE FileManager::PrepareDownload(const TransferSession_ptr & session, uint64_t fileSize,
    const checksum_field_t & fileChecksum, const boost::filesystem::path & finalPath,
    const boost::filesystem::path & resumeSourcePath, uint32_t startChunk)
{
    const uint32_t totalChunks = CftpProtocol::GetTotalChunks(fileSize, session->GetChunkSize());
    if (startChunk > totalChunks) {
        LOG_ERROR(subprocess) << "start chunk " << startChunk << " beyond " << totalChunks << " chunks";
        return CFTP_ERROR_TYPE::INVALID_RANGE;
    }
    session->SetFileInfo(fileSize, totalChunks, fileChecksum);
    session->SetFinalFilePath(finalPath);

    boost::filesystem::path tempPath = session->GetTempFilePath();
    if (!tempPath.empty()) {
        //a resumed session keeps its temp file and received chunks
        if (session->GetFileDescriptor() < 0) {
            const int fd = open(tempPath.c_str(), O_RDWR | O_CREAT, 0644);
            if (fd < 0) {
                LOG_ERROR(subprocess) << "cannot reopen temp file " << tempPath << ": " << strerror(errno);
                return CFTP_ERROR_TYPE::RESOURCE_ERROR;
            }
            session->SetFileDescriptor(fd);
        }
    }
    else {
        tempPath = M_TEMP_DIR / (session->GetSessionId() + "_" + boost::filesystem::path(session->GetFilename()).filename().string());
        try {
            boost::filesystem::create_directories(M_TEMP_DIR);
            if (!resumeSourcePath.empty()) {
                boost::filesystem::remove(tempPath);
                boost::filesystem::copy_file(resumeSourcePath, tempPath);
            }
        }
        catch (const boost::filesystem::filesystem_error & e) {
            LOG_ERROR(subprocess) << "cannot prepare temp file " << tempPath << ": " << e.what();
            return CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        const int fd = open(tempPath.c_str(), O_RDWR | O_CREAT, 0644);
        if (fd < 0) {
            LOG_ERROR(subprocess) << "cannot open temp file " << tempPath << ": " << strerror(errno);
            return CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        session->SetFileDescriptor(fd);
        session->SetTempFilePath(tempPath);
        if (!resumeSourcePath.empty()) {
            for (uint32_t i = 0; i < startChunk; ++i) {
                session->MarkChunkReceived(i);
            }
        }
    }
    if (ftruncate(session->GetFileDescriptor(), static_cast<off_t>(fileSize)) != 0) {
        LOG_ERROR(subprocess) << "cannot size temp file " << tempPath << " to " << fileSize << ": " << strerror(errno);
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    session->SetStatus(TRANSFER_SESSION_STATUS::TRANSFERRING);
    session->Touch();
    LOG_DEBUG(subprocess) << "session " << session->GetSessionId() << " writing " << totalChunks << " chunks to " << tempPath;
    return CFTP_ERROR_TYPE::NONE;
}

CFTP_ERROR_TYPE FileManager::WriteChunk(const std::string & sessionId, uint32_t chunkNumber, const uint8_t * data, std::size_t size) {
    TransferSession_ptr session = m_sessionRegistryRef.GetSession(sessionId);
    if (!session) {
        LOG_ERROR(subprocess) << "write to unknown session " << sessionId;
        return CFTP_ERROR_TYPE::SESSION_EXPIRED;
    }
    return WriteChunk(session, chunkNumber, data, size);
}

CFTP_ERROR_TYPE FileManager::WriteChunk(const TransferSession_ptr & session, uint32_t chunkNumber, const uint8_t * data, std::size_t size) {
    const uint64_t fileSize = session->GetFileSize();
    const uint32_t chunkSize = session->GetChunkSize();
    const uint32_t totalChunks = session->GetTotalChunks();
    if (chunkNumber >= totalChunks) {
        LOG_ERROR(subprocess) << "write of chunk " << chunkNumber << " outside [0," << totalChunks << ")";
        return CFTP_ERROR_TYPE::INVALID_RANGE;
    }
    const std::size_t expectedLength = CftpProtocol::GetChunkLength(fileSize, chunkSize, chunkNumber);
    if (size != expectedLength) {
        LOG_ERROR(subprocess) << "chunk " << chunkNumber << " has " << size << " bytes, expected " << expectedLength;
        return CFTP_ERROR_TYPE::INVALID_RANGE;
    }
    const int fd = session->GetFileDescriptor();
    if (fd < 0) {
        LOG_ERROR(subprocess) << "session " << session->GetSessionId() << " has no temp file";
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    const off_t offset = static_cast<off_t>(static_cast<uint64_t>(chunkNumber) * chunkSize);
    std::size_t totalWritten = 0;
    while (totalWritten < size) {
        const ssize_t n = pwrite(fd, data + totalWritten, size - totalWritten, offset + static_cast<off_t>(totalWritten));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(subprocess) << "pwrite failed on chunk " << chunkNumber << " of session " << session->GetSessionId() << ": " << strerror(errno);
            return CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        totalWritten += static_cast<std::size_t>(n);
    }
    //only this update needs the (per session) lock
    session->MarkChunkReceived(chunkNumber);
    session->Touch();
    return CFTP_ERROR_TYPE::NONE;
}

CFTP_ERROR_TYPE FileManager::Finalize(const std::string & sessionId) {
    TransferSession_ptr session = m_sessionRegistryRef.GetSession(sessionId);
    if (!session) {
        LOG_ERROR(subprocess) << "finalize of unknown session " << sessionId;
        return CFTP_ERROR_TYPE::SESSION_EXPIRED;
    }
    return Finalize(session);
}

CFTP_ERROR_TYPE FileManager::Finalize(const TransferSession_ptr & session) {
    if (!session->AllChunksReceived()) {
        LOG_ERROR(subprocess) << "cannot finalize session " << session->GetSessionId() << ": "
            << session->GetNumChunksReceived() << " of " << session->GetTotalChunks() << " chunks received";
        return CFTP_ERROR_TYPE::PROTOCOL_ERROR;
    }
    const boost::filesystem::path tempPath = session->GetTempFilePath();
    const boost::filesystem::path finalPath = session->GetFinalFilePath();
    const int fd = session->GetFileDescriptor();
    if ((fd >= 0) && (fsync(fd) != 0)) {
        LOG_ERROR(subprocess) << "fsync of " << tempPath << " failed: " << strerror(errno);
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    ContentDigest digest(M_DIGEST_ALGORITHM);
    checksum_field_t computed;
    if (!digest.ComputeFile(tempPath, computed)) {
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    const checksum_field_t expected = session->GetFileChecksum();
    if (computed != expected) {
        LOG_ERROR(subprocess) << "integrity check failed for " << session->GetFilename()
            << ": expected " << ContentDigest::ToHexString(expected, digest.GetDigestSize())
            << ", computed " << ContentDigest::ToHexString(computed, digest.GetDigestSize());
        return CFTP_ERROR_TYPE::INTEGRITY_ERROR;
    }
    session->CloseFileDescriptor();
    try {
        if (finalPath.has_parent_path()) {
            boost::filesystem::create_directories(finalPath.parent_path());
        }
        boost::filesystem::rename(tempPath, finalPath); //atomic within one file system
    }
    catch (const boost::filesystem::filesystem_error & e) {
        LOG_ERROR(subprocess) << "cannot move " << tempPath << " to " << finalPath << ": " << e.what();
        return CFTP_ERROR_TYPE::RESOURCE_ERROR;
    }
    session->SetStatus(TRANSFER_SESSION_STATUS::COMPLETED);
    LOG_INFO(subprocess) << "completed " << session->GetFilename() << " (" << session->GetFileSize() << " bytes) -> " << finalPath;
    return CFTP_ERROR_TYPE::NONE;
}

void FileManager::ReleaseSession(const TransferSession_ptr & session, bool transferFailed) {
    session->CloseFileDescriptor();
    if (transferFailed) {
        session->SetStatus(TRANSFER_SESSION_STATUS::FAILED);
        const boost::filesystem::path tempPath = session->GetTempFilePath();
        if ((!M_PRESERVE_TEMP_ON_ERROR) && (!tempPath.empty())) {
            boost::system::error_code ec;
            boost::filesystem::remove(tempPath, ec);
            if (ec) {
                LOG_ERROR(subprocess) << "cannot remove temp file " << tempPath << ": " << ec.message();
            }
            else {
                session->SetTempFilePath(boost::filesystem::path());
                LOG_DEBUG(subprocess) << "discarded temp file " << tempPath;
            }
        }
    }
}

void FileManager::OnSessionExpired(const TransferSession_ptr & session) {
    //the descriptor closes when the last holder of the session lets go
    const boost::filesystem::path tempPath = session->GetTempFilePath();
    if ((!M_PRESERVE_TEMP_ON_ERROR) && (!tempPath.empty())) {
        boost::system::error_code ec;
        boost::filesystem::remove(tempPath, ec);
        if (ec) {
            LOG_ERROR(subprocess) << "cannot remove temp file " << tempPath << " of expired session: " << ec.message();
        }
    }
}

//appends one listing entry, or logs and skips an entry whose metadata cannot be read
static void AppendListEntry(const boost::filesystem::directory_entry & dirEntry, const std::string & name,
    CFTP_LIST_FILTER filter, list_entry_vector_t & entries)
{
    boost::system::error_code ec;
    const boost::filesystem::file_status status = dirEntry.status(ec);
    if (ec) {
        LOG_WARNING(subprocess) << "skipping " << dirEntry.path() << ": " << ec.message();
        return;
    }
    const bool isDirectory = boost::filesystem::is_directory(status);
    if ((!isDirectory) && (!boost::filesystem::is_regular_file(status))) {
        LOG_WARNING(subprocess) << "skipping " << dirEntry.path() << ": not a regular file or directory";
        return;
    }
    if ((filter == CFTP_LIST_FILTER::FILES_ONLY && isDirectory) || (filter == CFTP_LIST_FILTER::DIRECTORIES_ONLY && !isDirectory)) {
        return;
    }
    uint64_t fileSize = 0;
    if (!isDirectory) {
        fileSize = static_cast<uint64_t>(boost::filesystem::file_size(dirEntry.path(), ec));
        if (ec) {
            LOG_WARNING(subprocess) << "skipping " << dirEntry.path() << ": " << ec.message();
            return;
        }
    }
    const std::time_t mtime = boost::filesystem::last_write_time(dirEntry.path(), ec);
    if (ec) {
        LOG_WARNING(subprocess) << "skipping " << dirEntry.path() << ": " << ec.message();
        return;
    }
    entries.emplace_back(name, isDirectory, fileSize, static_cast<uint64_t>(mtime));
}

CFTP_ERROR_TYPE FileManager::List(const std::string & requestPath, CFTP_LIST_FILTER filter, list_entry_vector_t & entries) const {
    entries.clear();
    boost::filesystem::path dirPath;
    if (!ResolvePathUnderRoot(requestPath, dirPath)) {
        return CFTP_ERROR_TYPE::NOT_FOUND;
    }
    boost::system::error_code ec;
    if (!boost::filesystem::is_directory(dirPath, ec)) {
        LOG_INFO(subprocess) << "list of missing directory " << dirPath;
        return CFTP_ERROR_TYPE::NOT_FOUND;
    }
    if (M_LIST_RECURSIVE) {
        boost::filesystem::recursive_directory_iterator it(dirPath, ec);
        const boost::filesystem::recursive_directory_iterator end;
        if (ec) {
            LOG_ERROR(subprocess) << "cannot list " << dirPath << ": " << ec.message();
            return CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        while (it != end) {
            const std::string name = it->path().lexically_relative(dirPath).generic_string();
            AppendListEntry(*it, name, filter, entries);
            it.increment(ec);
            if (ec) {
                //unreadable subdirectory: keep what was gathered so far
                LOG_WARNING(subprocess) << "stopping recursive list of " << dirPath << ": " << ec.message();
                break;
            }
        }
    }
    else {
        boost::filesystem::directory_iterator it(dirPath, ec);
        const boost::filesystem::directory_iterator end;
        if (ec) {
            LOG_ERROR(subprocess) << "cannot list " << dirPath << ": " << ec.message();
            return CFTP_ERROR_TYPE::RESOURCE_ERROR;
        }
        while (it != end) {
            AppendListEntry(*it, it->path().filename().string(), filter, entries);
            it.increment(ec);
            if (ec) {
                LOG_WARNING(subprocess) << "stopping list of " << dirPath << ": " << ec.message();
                break;
            }
        }
    }
    std::sort(entries.begin(), entries.end());
    return CFTP_ERROR_TYPE::NONE;
}
