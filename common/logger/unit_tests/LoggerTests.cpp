/**
 * @file LoggerTests.cpp
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

#include <boost/regex.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/test/unit_test.hpp>
#include <string>
#include "Logger.h"
#if (defined(LOG_TO_PROCESS_FILE) || defined(LOG_TO_SUBPROCESS_FILES) || defined(LOG_TO_ERROR_FILE))
/**
 * Counts the total number of lines in a file 
 */
static int countLines(std::string filePath)
{
    std::ifstream in(filePath);
    int count = static_cast<int>(std::count(std::istreambuf_iterator<char>(in), 
            std::istreambuf_iterator<char>(), '\n'));
    in.close();
    return count;
}

/**
 * Reads a file's contents into a string and returns it
 * @param path the path to the file
 * @param maxLines the maximum number of lines to return, starting at the end of the file
 */
static std::string file_contents_to_str(std::string path, uint8_t maxLines)
{
    std::string inLine;
    std::stringstream outBuffer;
    std::ifstream inFile(path);
    int totalLines = countLines(path);
    int currentLine = 1;
    while(std::getline(inFile, inLine)) {
        if (currentLine > (totalLines - maxLines)) {
            outBuffer << inLine << "\n";
        }
        currentLine++;
    }
    return outBuffer.str();
}
#endif

/**
 * OutputTester is used for redirecting cout and cerr
 * into a test buffer so the data can be used in testing.
 */
class OutputTester {
public:
    OutputTester()
    {
        cerr_backup = nullptr;
        cout_backup = nullptr;
    }

    void redirect_cout_cerr()
    {
        cerr_backup = std::cerr.rdbuf();
        cout_backup = std::cout.rdbuf();
        std::cerr.rdbuf(cerr_test_stream.rdbuf());
        std::cout.rdbuf(cout_test_stream.rdbuf());
    }

    void reset_cout_cerr()
    {
        if (cout_backup) {
            std::cout.rdbuf(cout_backup);
        }
        if (cerr_backup) {
            std::cerr.rdbuf(cerr_backup);
        }
    }

    std::stringstream cerr_test_stream;
    std::stringstream cout_test_stream;

private:
    std::streambuf *cerr_backup;
    std::streambuf *cout_backup;
};

static const std::string date_regex = "\\[ \\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}]";

BOOST_AUTO_TEST_CASE(LoggerToStringTestCase)
{
    // Process
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::Process::transferserver), "transferserver");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::Process::transferclient), "transferclient");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::Process::unittest), "unittest");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::Process::none), "");

    // Subprocess
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::codec), "codec");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::registry), "registry");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::filemanager), "filemanager");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::protocol), "protocol");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::server), "server");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::client), "client");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::control), "control");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::unittest), "unittest");
    BOOST_REQUIRE_EQUAL(cftp::Logger::toString(cftp::Logger::SubProcess::none), "");
}

BOOST_AUTO_TEST_CASE(LoggerTailSinkTestCase)
{
    OutputTester output_tester;
    output_tester.redirect_cout_cerr();

    _LOG_INTERNAL(cftp::Logger::SubProcess::protocol, boost::log::trivial::severity_level::info) << "Tail sink first";
    _LOG_INTERNAL(cftp::Logger::SubProcess::none, boost::log::trivial::severity_level::error) << "Tail sink second";

    output_tester.reset_cout_cerr();

    const cftp::log_tail_entry_vector_t entries = cftp::Logger::GetRecentLogEntries(2);
    BOOST_REQUIRE_EQUAL(entries.size(), 2);
    BOOST_REQUIRE_EQUAL(entries[0].module, "protocol");
    BOOST_REQUIRE_EQUAL(entries[0].level, "info");
    BOOST_REQUIRE_EQUAL(entries[0].message, "Tail sink first");
    BOOST_REQUIRE(boost::regex_match(entries[0].timestamp, boost::regex("^\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}$")));
    //no channel => falls back to the process name set by the global test fixture
    BOOST_REQUIRE_EQUAL(entries[1].module, "unittest");
    BOOST_REQUIRE_EQUAL(entries[1].level, "error");
    BOOST_REQUIRE_EQUAL(entries[1].message, "Tail sink second");

    BOOST_REQUIRE_LE(cftp::Logger::GetRecentLogEntries().size(), cftp::Logger::LOG_TAIL_CAPACITY);
}

BOOST_AUTO_TEST_CASE(LoggerTailSinkCapacityTestCase)
{
    OutputTester output_tester;
    output_tester.redirect_cout_cerr();
    for (std::size_t i = 0; i < cftp::Logger::LOG_TAIL_CAPACITY + 10; ++i) {
        _LOG_INTERNAL(cftp::Logger::SubProcess::unittest, boost::log::trivial::severity_level::debug) << "capacity " << i;
    }
    output_tester.reset_cout_cerr();

    const cftp::log_tail_entry_vector_t entries = cftp::Logger::GetRecentLogEntries();
    BOOST_REQUIRE_EQUAL(entries.size(), cftp::Logger::LOG_TAIL_CAPACITY);
    BOOST_REQUIRE_EQUAL(entries.front().message, "capacity 10");
    BOOST_REQUIRE_EQUAL(entries.back().message, "capacity " + std::to_string(cftp::Logger::LOG_TAIL_CAPACITY + 9));
}

#ifdef LOG_TO_CONSOLE
BOOST_AUTO_TEST_CASE(LoggerStdoutTestCase)
{
    // First, swap out the cout buffer with the boost test stream
    // so we can capture output
    OutputTester output_tester;
    output_tester.redirect_cout_cerr();

    // Do logging with sub-processes
    _LOG_INTERNAL(cftp::Logger::SubProcess::protocol, boost::log::trivial::severity_level::trace) << "Protocol foo bar";
    _LOG_INTERNAL(cftp::Logger::SubProcess::filemanager, boost::log::trivial::severity_level::debug) << "FileManager foo bar";
    _LOG_INTERNAL(cftp::Logger::SubProcess::server, boost::log::trivial::severity_level::info) << "Server foo bar";
    _LOG_INTERNAL(cftp::Logger::SubProcess::protocol, boost::log::trivial::severity_level::error) << "Protocol foo bar!";
    _LOG_INTERNAL(cftp::Logger::SubProcess::client, boost::log::trivial::severity_level::fatal) << "Client foo bar!";

    // Put buffers back
    output_tester.reset_cout_cerr();

    // Assert results
    BOOST_REQUIRE_EQUAL(output_tester.cout_test_stream.str(),
        std::string("[ protocol      ][ trace]: Protocol foo bar\n") +
        std::string("[ filemanager   ][ debug]: FileManager foo bar\n") +
        std::string("[ server        ][ info ]: Server foo bar\n") +
        std::string("[ protocol      ][ error]: Protocol foo bar!\n") +
        std::string("[ client        ][ fatal]: Client foo bar!\n")
    );
}
#endif

#ifdef LOG_TO_PROCESS_FILE
BOOST_AUTO_TEST_CASE(LoggerProcessFileTestCase)
{
    OutputTester output_tester;
    output_tester.redirect_cout_cerr();

    _LOG_INTERNAL(cftp::Logger::SubProcess::protocol, boost::log::trivial::severity_level::info) << "Protocol file test case";
    _LOG_INTERNAL(cftp::Logger::SubProcess::server, boost::log::trivial::severity_level::error) << "Server file test case";

    output_tester.reset_cout_cerr();

    BOOST_TEST(boost::filesystem::exists("logs/"));
    BOOST_TEST(boost::filesystem::exists("logs/unittest_00000.log"));
    BOOST_TEST(boost::regex_match(
        file_contents_to_str("logs/unittest_00000.log", 2),
        boost::regex("^\\[ protocol      ]" + date_regex + "\\[ info]: Protocol file test case\n\\[ server        ]" + date_regex + "\\[ error]: Server file test case\n$"))
    );
}
#endif

#ifdef LOG_TO_ERROR_FILE
BOOST_AUTO_TEST_CASE(LoggerErrorFileTestCase) {
    OutputTester output_tester;
    output_tester.redirect_cout_cerr();

    _LOG_INTERNAL(cftp::Logger::SubProcess::filemanager, boost::log::trivial::severity_level::error) << "Error file test case";

    output_tester.reset_cout_cerr();

    BOOST_TEST(boost::filesystem::exists("logs/"));
    std::string file = "logs/error_00000.log";
    if (boost::filesystem::exists("logs/error_00001.log")) {
        file = "logs/error_00001.log";
    }
    BOOST_TEST(boost::regex_match(
        file_contents_to_str(file, 1),
        boost::regex("^\\[ unittest]\\[ filemanager]" + date_regex + "\\[.*LoggerTests.cpp:\\d{3}]: Error file test case\n$"))
    );
}
#endif
