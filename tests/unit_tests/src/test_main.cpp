/**
 * @file test_main.cpp
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
 * This file launches all CFTP unit tests (using Boost Test) into a process.
 * The unit test framework will provide its own main() function.
 * It also defines the scratch file helpers declared in TestFileHelpers.h.
 */


#define BOOST_TEST_MODULE CftpUnitTestsModule

//note: BOOST_TEST_DYN_LINK may be set as global compile definition by CMake script

#include <boost/test/unit_test.hpp>
#include <boost/test/results_reporter.hpp>
#include <boost/test/unit_test_parameters.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <iterator>
#include "Logger.h"
#include "TestFileHelpers.h"

// Global Test Fixture. Used to setup report options for all unit tests.
class BoostUnitTestsFixture {
public:
    BoostUnitTestsFixture();
    ~BoostUnitTestsFixture();
};

BoostUnitTestsFixture::BoostUnitTestsFixture() {
    boost::unit_test::results_reporter::set_level(boost::unit_test::report_level::DETAILED_REPORT);
    boost::unit_test::unit_test_log.set_threshold_level( boost::unit_test::log_messages );
    cftp::Logger::initializeWithProcess(cftp::Logger::Process::unittest);
    boost::filesystem::remove_all("logs");
}

BoostUnitTestsFixture::~BoostUnitTestsFixture() {
}

BOOST_GLOBAL_FIXTURE(BoostUnitTestsFixture);


ScopedTestDirectory::ScopedTestDirectory(const std::string & prefix) :
    m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path(prefix + "_%%%%-%%%%-%%%%"))
{
    boost::filesystem::create_directories(m_path);
}

ScopedTestDirectory::~ScopedTestDirectory() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(m_path, ec);
}

const boost::filesystem::path & ScopedTestDirectory::Path() const {
    return m_path;
}

boost::filesystem::path ScopedTestDirectory::SubDirectory(const std::string & name) const {
    const boost::filesystem::path p = m_path / name;
    boost::filesystem::create_directories(p);
    return p;
}

std::vector<uint8_t> MakeTestFileContents(std::size_t size, uint32_t seed) {
    boost::random::mt19937 gen(seed);
    std::vector<uint8_t> contents(size);
    for (std::size_t i = 0; i < size; ++i) {
        contents[i] = static_cast<uint8_t>(gen());
    }
    return contents;
}

bool WriteTestFile(const boost::filesystem::path & filePath, const std::vector<uint8_t> & contents) {
    boost::filesystem::ofstream ofs(filePath, std::ofstream::out | std::ofstream::binary | std::ofstream::trunc);
    if (!ofs.good()) {
        return false;
    }
    ofs.write(reinterpret_cast<const char*>(contents.data()), static_cast<std::streamsize>(contents.size()));
    return ofs.good();
}

bool ReadWholeTestFile(const boost::filesystem::path & filePath, std::vector<uint8_t> & contents) {
    boost::filesystem::ifstream ifs(filePath, std::ifstream::in | std::ifstream::binary);
    if (!ifs.good()) {
        return false;
    }
    contents.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return true;
}
