/**
 * @file TestContentDigest.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include "ContentDigest.h"
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <string>

BOOST_AUTO_TEST_CASE(ContentDigestMd5TestCase)
{
    ContentDigest digest; //md5 default
    BOOST_REQUIRE(digest.GetAlgorithm() == DIGEST_ALGORITHM::MD5);
    BOOST_REQUIRE_EQUAL(digest.GetDigestSize(), 16);

    checksum_field_t checksum;
    BOOST_REQUIRE(digest.Compute(NULL, 0, checksum));
    BOOST_REQUIRE_EQUAL(ContentDigest::ToHexString(checksum, 16), "d41d8cd98f00b204e9800998ecf8427e");
    //zero padded
    for (std::size_t i = 16; i < CFTP_CHECKSUM_FIELD_SIZE; ++i) {
        BOOST_REQUIRE_EQUAL(checksum[i], 0);
    }

    const std::string abc("abc");
    BOOST_REQUIRE(digest.Compute(abc.data(), abc.size(), checksum));
    BOOST_REQUIRE_EQUAL(ContentDigest::ToHexString(checksum, 16), "900150983cd24fb0d6963f7d28e17f72");
    BOOST_REQUIRE_EQUAL(ContentDigest::ToHexString(checksum), "900150983cd24fb0d6963f7d28e17f7200000000000000000000000000000000");

    //streaming in pieces gives the same digest (context reuse)
    checksum_field_t checksumStreamed;
    BOOST_REQUIRE(digest.Init());
    BOOST_REQUIRE(digest.Update(abc.data(), 1));
    BOOST_REQUIRE(digest.Update(abc.data() + 1, 2));
    BOOST_REQUIRE(digest.Final(checksumStreamed));
    BOOST_REQUIRE(checksum == checksumStreamed);
}

BOOST_AUTO_TEST_CASE(ContentDigestSha256TestCase)
{
    DIGEST_ALGORITHM algorithm;
    BOOST_REQUIRE(ContentDigest::GetAlgorithmFromString("sha256", algorithm));
    BOOST_REQUIRE(!ContentDigest::GetAlgorithmFromString("crc32", algorithm));
    BOOST_REQUIRE_EQUAL(ContentDigest::AlgorithmToString(DIGEST_ALGORITHM::SHA256), "sha256");
    ContentDigest digest(DIGEST_ALGORITHM::SHA256);
    BOOST_REQUIRE_EQUAL(digest.GetDigestSize(), 32);

    checksum_field_t checksum;
    BOOST_REQUIRE(digest.Compute(NULL, 0, checksum));
    BOOST_REQUIRE_EQUAL(ContentDigest::ToHexString(checksum), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    const std::string abc("abc");
    BOOST_REQUIRE(digest.Compute(abc.data(), abc.size(), checksum));
    BOOST_REQUIRE_EQUAL(ContentDigest::ToHexString(checksum), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

BOOST_AUTO_TEST_CASE(ContentDigestFileTestCase)
{
    const boost::filesystem::path filePath = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cftp_digest_%%%%%%.bin");
    std::string contents;
    for (unsigned int i = 0; i < 200000; ++i) { //spans several read buffers
        contents.push_back(static_cast<char>(i * 7));
    }
    {
        boost::filesystem::ofstream ofs(filePath, std::ofstream::out | std::ofstream::binary);
        ofs.write(contents.data(), contents.size());
    }
    ContentDigest digest;
    checksum_field_t fromFile;
    checksum_field_t fromMemory;
    BOOST_REQUIRE(digest.ComputeFile(filePath, fromFile));
    BOOST_REQUIRE(digest.Compute(contents.data(), contents.size(), fromMemory));
    BOOST_REQUIRE(fromFile == fromMemory);
    boost::filesystem::remove(filePath);

    BOOST_REQUIRE(!digest.ComputeFile(filePath, fromFile)); //removed
}
