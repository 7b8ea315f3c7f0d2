/**
 * @file ContentDigest.cpp
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

#include "ContentDigest.h"
#include "Logger.h"
#include <boost/make_unique.hpp>
#include <boost/noncopyable.hpp>
#include <boost/filesystem/fstream.hpp>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <vector>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::codec;

struct ContentDigest::Impl : private boost::noncopyable {
    Impl(DIGEST_ALGORITHM algorithm) :
        m_ctx(EVP_MD_CTX_new()),
        m_md((algorithm == DIGEST_ALGORITHM::SHA256) ? EVP_sha256() : EVP_md5()), //returns pointer to a static const variable
        m_algorithm(algorithm) {}
    ~Impl() {
        if (m_ctx) {
            EVP_MD_CTX_free(m_ctx);
            m_ctx = NULL;
        }
    }
    EVP_MD_CTX* m_ctx;
    const EVP_MD* m_md;
    const DIGEST_ALGORITHM m_algorithm;
};

ContentDigest::ContentDigest(DIGEST_ALGORITHM algorithm) : m_pimpl(boost::make_unique<ContentDigest::Impl>(algorithm)) {}
ContentDigest::~ContentDigest() {}

bool ContentDigest::GetAlgorithmFromString(const std::string & name, DIGEST_ALGORITHM & algorithm) {
    if (name == "md5") {
        algorithm = DIGEST_ALGORITHM::MD5;
        return true;
    }
    else if (name == "sha256") {
        algorithm = DIGEST_ALGORITHM::SHA256;
        return true;
    }
    return false;
}

std::string ContentDigest::AlgorithmToString(DIGEST_ALGORITHM algorithm) {
    return (algorithm == DIGEST_ALGORITHM::SHA256) ? "sha256" : "md5";
}

DIGEST_ALGORITHM ContentDigest::GetAlgorithm() const noexcept {
    return m_pimpl->m_algorithm;
}

std::size_t ContentDigest::GetDigestSize() const noexcept {
    return (m_pimpl->m_algorithm == DIGEST_ALGORITHM::SHA256) ? 32 : 16;
}

bool ContentDigest::Init() {
    if (m_pimpl->m_ctx == NULL) {
        LOG_ERROR(subprocess) << "EVP_MD_CTX_new failed";
        return false;
    }
    //EVP_DigestInit_ex() returns 1 for success and 0 for failure.
    //The context is reused between digests without reallocating.
    if (!EVP_DigestInit_ex(m_pimpl->m_ctx, m_pimpl->m_md, NULL)) {
        LOG_ERROR(subprocess) << "EVP_DigestInit_ex failed: " << ERR_get_error();
        return false;
    }
    return true;
}

bool ContentDigest::Update(const void * data, std::size_t size) {
    if (size == 0) {
        return true;
    }
    if (!EVP_DigestUpdate(m_pimpl->m_ctx, data, size)) {
        LOG_ERROR(subprocess) << "EVP_DigestUpdate failed: " << ERR_get_error();
        return false;
    }
    return true;
}

bool ContentDigest::Final(checksum_field_t & checksumOut) {
    checksumOut.fill(0);
    unsigned int digestLength = 0;
    if (!EVP_DigestFinal_ex(m_pimpl->m_ctx, checksumOut.data(), &digestLength)) {
        LOG_ERROR(subprocess) << "EVP_DigestFinal_ex failed: " << ERR_get_error();
        return false;
    }
    if (digestLength != GetDigestSize()) {
        LOG_ERROR(subprocess) << "unexpected digest length " << digestLength;
        return false;
    }
    return true;
}

bool ContentDigest::Compute(const void * data, std::size_t size, checksum_field_t & checksumOut) {
    return Init() && Update(data, size) && Final(checksumOut);
}

bool ContentDigest::ComputeFile(const boost::filesystem::path & filePath, checksum_field_t & checksumOut) {
    boost::filesystem::ifstream ifs(filePath, std::ifstream::in | std::ifstream::binary);
    if (!ifs.good()) {
        LOG_ERROR(subprocess) << "cannot open " << filePath << " for digest";
        return false;
    }
    if (!Init()) {
        return false;
    }
    std::vector<char> buffer(65536);
    while (ifs) {
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize numRead = ifs.gcount();
        if (numRead > 0) {
            if (!Update(buffer.data(), static_cast<std::size_t>(numRead))) {
                return false;
            }
        }
    }
    if (ifs.bad()) {
        LOG_ERROR(subprocess) << "error reading " << filePath << " for digest";
        return false;
    }
    return Final(checksumOut);
}

std::string ContentDigest::ToHexString(const checksum_field_t & checksum, std::size_t numBytes) {
    static const char * const HEX_CHARS = "0123456789abcdef";
    if ((numBytes == 0) || (numBytes > checksum.size())) {
        numBytes = checksum.size();
    }
    std::string hex;
    hex.reserve(numBytes * 2);
    for (std::size_t i = 0; i < numBytes; ++i) {
        hex.push_back(HEX_CHARS[checksum[i] >> 4]);
        hex.push_back(HEX_CHARS[checksum[i] & 0x0f]);
    }
    return hex;
}
