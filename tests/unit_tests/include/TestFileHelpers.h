/**
 * @file TestFileHelpers.h
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
 * Helpers shared by the unit tests for creating scratch server trees
 * (root and temp directories) and deterministic file contents.
 */

#ifndef TEST_FILE_HELPERS_H
#define TEST_FILE_HELPERS_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>

/// A unique directory under the system temp directory, removed recursively on destruction
class ScopedTestDirectory {
public:
    explicit ScopedTestDirectory(const std::string & prefix);
    ~ScopedTestDirectory();
    ScopedTestDirectory(const ScopedTestDirectory&) = delete;
    ScopedTestDirectory& operator=(const ScopedTestDirectory&) = delete;

    const boost::filesystem::path & Path() const;
    /// Creates (if needed) and returns Path() / name
    boost::filesystem::path SubDirectory(const std::string & name) const;
private:
    boost::filesystem::path m_path;
};

/// Deterministic pseudo random bytes for a given seed
std::vector<uint8_t> MakeTestFileContents(std::size_t size, uint32_t seed);

bool WriteTestFile(const boost::filesystem::path & filePath, const std::vector<uint8_t> & contents);

bool ReadWholeTestFile(const boost::filesystem::path & filePath, std::vector<uint8_t> & contents);

#endif //TEST_FILE_HELPERS_H
