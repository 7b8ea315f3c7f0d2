/**
 * @file ContentDigest.h
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
 * This ContentDigest class computes the payload and whole-file checksums
 * carried by CFTP frames, using the OpenSSL EVP message digest API.
 * The algorithm (md5 or sha256) is selected at construction.
 * Results are always returned in a fixed 32-byte field; digests shorter
 * than 32 bytes are left-aligned and zero-padded.
 * An instance owns one reusable EVP_MD_CTX and is not thread safe;
 * give each thread (or each connection handler) its own instance.
 */

#ifndef CONTENT_DIGEST_H
#define CONTENT_DIGEST_H 1

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <boost/filesystem/path.hpp>
#include "content_digest_export.h"

enum class DIGEST_ALGORITHM : uint8_t {
    MD5 = 0,
    SHA256
};

/// Width of every checksum field on the wire
#define CFTP_CHECKSUM_FIELD_SIZE 32

typedef std::array<uint8_t, CFTP_CHECKSUM_FIELD_SIZE> checksum_field_t;

class ContentDigest {
public:
    CONTENT_DIGEST_EXPORT explicit ContentDigest(DIGEST_ALGORITHM algorithm = DIGEST_ALGORITHM::MD5);
    CONTENT_DIGEST_EXPORT ~ContentDigest();
    ContentDigest(const ContentDigest&) = delete;
    ContentDigest& operator=(const ContentDigest&) = delete;

    /** Parse a configuration name ("md5", "sha256").
     *
     * @param name The algorithm name.
     * @param algorithm The parsed algorithm.
     * @return True if the name is known, or False otherwise.
     */
    CONTENT_DIGEST_EXPORT static bool GetAlgorithmFromString(const std::string & name, DIGEST_ALGORITHM & algorithm);
    CONTENT_DIGEST_EXPORT static std::string AlgorithmToString(DIGEST_ALGORITHM algorithm);

    CONTENT_DIGEST_EXPORT DIGEST_ALGORITHM GetAlgorithm() const noexcept;

    /// Number of significant bytes at the front of the checksum field (16 for md5, 32 for sha256)
    CONTENT_DIGEST_EXPORT std::size_t GetDigestSize() const noexcept;

    //streaming interface
    CONTENT_DIGEST_EXPORT bool Init();
    CONTENT_DIGEST_EXPORT bool Update(const void * data, std::size_t size);
    CONTENT_DIGEST_EXPORT bool Final(checksum_field_t & checksumOut);

    /** Digest a contiguous buffer.
     *
     * @param data The bytes to digest (may be NULL if size is 0).
     * @param size The number of bytes.
     * @param checksumOut The zero-padded checksum field.
     * @return True if the digest was computed, or False on an OpenSSL failure.
     */
    CONTENT_DIGEST_EXPORT bool Compute(const void * data, std::size_t size, checksum_field_t & checksumOut);

    /** Digest the full contents of a file.
     *
     * @param filePath The file to read.
     * @param checksumOut The zero-padded checksum field.
     * @return True if the file was read and digested, or False otherwise.
     */
    CONTENT_DIGEST_EXPORT bool ComputeFile(const boost::filesystem::path & filePath, checksum_field_t & checksumOut);

    /// Lower case hex of the first numBytes of the field (0 => whole field)
    CONTENT_DIGEST_EXPORT static std::string ToHexString(const checksum_field_t & checksum, std::size_t numBytes = 0);

private:
    /// PIMPL idiom
    struct Impl;
    /// Pointer to the internal implementation
    std::unique_ptr<Impl> m_pimpl;
};

#endif //CONTENT_DIGEST_H
