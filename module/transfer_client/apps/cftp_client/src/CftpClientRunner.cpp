/**
 * @file CftpClientRunner.cpp
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

#include "CftpClientRunner.h"
#include "TcpFileTransferClient.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::client;

static constexpr uint32_t DEFAULT_RESUME_CHUNK_SIZE = 8192;

CftpClientRunner::CftpClientRunner() : m_lastResult(CFTP_ERROR_TYPE::NONE), m_lastReportedPercent(-1) {}
CftpClientRunner::~CftpClientRunner() {}

void CftpClientRunner::OnDownloadProgress(const std::string & remoteFilename, double progress) {
    const int percent = static_cast<int>(progress * 100.0);
    if ((percent / 10) != (m_lastReportedPercent / 10)) {
        LOG_INFO(subprocess) << remoteFilename << ": " << percent << "%";
    }
    m_lastReportedPercent = percent;
}

bool CftpClientRunner::Run(int argc, const char* const argv[]) {
    std::string host;
    uint16_t port;
    std::string clientId;
    boost::filesystem::path saveDirectory;
    boost::filesystem::path tempDirectory;
    std::string remoteFilename;
    boost::filesystem::path saveAs;
    boost::filesystem::path resumeFrom;
    uint32_t startChunk = 0;
    bool doList;
    std::string listPath;
    CFTP_LIST_FILTER listFilter = CFTP_LIST_FILTER::ALL;
    DIGEST_ALGORITHM digestAlgorithm = DIGEST_ALGORITHM::MD5;
    bool preserveTempOnError;

    boost::program_options::options_description desc("Allowed options");
    try {
        desc.add_options()
            ("help", "Produce help message.")
            ("host", boost::program_options::value<std::string>()->default_value("localhost"), "Transfer server host.")
            ("port", boost::program_options::value<uint16_t>()->default_value(8001), "Transfer server port.")
            ("client-id", boost::program_options::value<std::string>()->default_value("cftp-client"), "Client id sent in the handshake.")
            ("save-dir", boost::program_options::value<boost::filesystem::path>()->default_value("."), "Directory relative save paths are resolved against.")
            ("temp-dir", boost::program_options::value<boost::filesystem::path>()->default_value("./.cftp_partial"), "Directory for partial downloads.")
            ("download", boost::program_options::value<std::string>()->default_value(""), "Remote filename to download.")
            ("save-as", boost::program_options::value<boost::filesystem::path>()->default_value(""), "Local path of the download (default: the remote filename).")
            ("resume-from", boost::program_options::value<boost::filesystem::path>()->default_value(""), "Partial local copy to resume the download from.")
            ("start-chunk", boost::program_options::value<uint32_t>(), "First chunk to request when resuming (default: whole 8192 byte chunks held by --resume-from).")
            ("list", "List a remote directory.")
            ("list-path", boost::program_options::value<std::string>()->default_value(""), "Remote directory to list (default: the server root).")
            ("list-filter", boost::program_options::value<std::string>()->default_value("all"), "all, files or directories.")
            ("digest", boost::program_options::value<std::string>()->default_value("md5"), "Digest algorithm (must match the server): md5 or sha256.")
            ("discard-temp-on-error", "Remove the partial file when a download fails.")
            ;

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc, boost::program_options::command_line_style::unix_style | boost::program_options::command_line_style::case_insensitive), vm);
        boost::program_options::notify(vm);

        if (vm.count("help")) {
            LOG_INFO(subprocess) << desc;
            return false;
        }
        host = vm["host"].as<std::string>();
        port = vm["port"].as<uint16_t>();
        clientId = vm["client-id"].as<std::string>();
        saveDirectory = vm["save-dir"].as<boost::filesystem::path>();
        tempDirectory = vm["temp-dir"].as<boost::filesystem::path>();
        remoteFilename = vm["download"].as<std::string>();
        saveAs = vm["save-as"].as<boost::filesystem::path>();
        resumeFrom = vm["resume-from"].as<boost::filesystem::path>();
        doList = (vm.count("list") != 0);
        listPath = vm["list-path"].as<std::string>();
        preserveTempOnError = (vm.count("discard-temp-on-error") == 0);

        const std::string listFilterString = vm["list-filter"].as<std::string>();
        if (listFilterString == "files") {
            listFilter = CFTP_LIST_FILTER::FILES_ONLY;
        }
        else if (listFilterString == "directories") {
            listFilter = CFTP_LIST_FILTER::DIRECTORIES_ONLY;
        }
        else if (listFilterString != "all") {
            LOG_ERROR(subprocess) << "invalid list filter " << listFilterString;
            return false;
        }
        if (!ContentDigest::GetAlgorithmFromString(vm["digest"].as<std::string>(), digestAlgorithm)) {
            LOG_ERROR(subprocess) << "invalid digest algorithm " << vm["digest"].as<std::string>();
            return false;
        }
        if (remoteFilename.empty() && (!doList)) {
            LOG_ERROR(subprocess) << "nothing to do: specify --download and/or --list";
            LOG_ERROR(subprocess) << desc;
            return false;
        }
        if (!resumeFrom.empty()) {
            if (remoteFilename.empty()) {
                LOG_ERROR(subprocess) << "--resume-from requires --download";
                return false;
            }
            boost::system::error_code ec;
            const uintmax_t partialSize = boost::filesystem::file_size(resumeFrom, ec);
            if (ec) {
                LOG_ERROR(subprocess) << "cannot resume from " << resumeFrom << ": " << ec.message();
                return false;
            }
            startChunk = (vm.count("start-chunk")) ?
                vm["start-chunk"].as<uint32_t>() :
                static_cast<uint32_t>(partialSize / DEFAULT_RESUME_CHUNK_SIZE);
        }
    }
    catch (boost::bad_any_cast & e) {
        LOG_ERROR(subprocess) << "invalid data error: " << e.what() << "\n";
        LOG_ERROR(subprocess) << desc;
        return false;
    }
    catch (std::exception& e) {
        LOG_ERROR(subprocess) << e.what();
        return false;
    }

    TcpFileTransferClient client(saveDirectory, tempDirectory, digestAlgorithm, preserveTempOnError);
    if (!client.Init()) {
        LOG_FATAL(subprocess) << "Cannot Init client directories";
        return false;
    }
    client.SetDownloadProgressCallback(boost::bind(&CftpClientRunner::OnDownloadProgress, this,
        boost::placeholders::_1, boost::placeholders::_2));
    if (!client.Connect(host, port, clientId)) {
        LOG_FATAL(subprocess) << "Cannot connect to " << host << ":" << port;
        m_lastResult = CFTP_ERROR_TYPE::RESOURCE_ERROR;
        return false;
    }

    bool success = true;
    if (doList) {
        list_entry_vector_t entries;
        m_lastResult = client.ListFiles(listFilter, listPath, entries);
        if (m_lastResult != CFTP_ERROR_TYPE::NONE) {
            LOG_ERROR(subprocess) << "listing " << ((listPath.empty()) ? std::string("/") : listPath)
                << " failed: " << CftpProtocol::ErrorTypeToString(m_lastResult);
            success = false;
        }
        else {
            LOG_INFO(subprocess) << entries.size() << " entries in " << ((listPath.empty()) ? std::string("/") : listPath);
            for (std::size_t i = 0; i < entries.size(); ++i) {
                const list_entry_t & e = entries[i];
                LOG_INFO(subprocess) << ((e.isDirectory) ? "d " : "- ") << e.size << " " << e.mtimeUnixSeconds << " " << e.name;
            }
        }
    }
    if (success && (!remoteFilename.empty()) && client.IsConnected()) {
        const boost::filesystem::path localPath = (saveAs.empty()) ? boost::filesystem::path(remoteFilename).filename() : saveAs;
        if (!resumeFrom.empty()) {
            LOG_INFO(subprocess) << "resuming " << remoteFilename << " from chunk " << startChunk << " of " << resumeFrom;
        }
        m_lastResult = client.DownloadFile(remoteFilename, localPath, resumeFrom, startChunk);
        if (m_lastResult != CFTP_ERROR_TYPE::NONE) {
            LOG_ERROR(subprocess) << "download of " << remoteFilename << " failed: " << CftpProtocol::ErrorTypeToString(m_lastResult);
            if (preserveTempOnError && client.GetLastSession()) {
                LOG_INFO(subprocess) << "partial file kept at " << client.GetLastSession()->GetTempFilePath();
            }
            success = false;
        }
        else {
            LOG_INFO(subprocess) << "saved " << remoteFilename << " to " << client.ResolveLocalPath(localPath);
        }
    }
    if (client.IsConnected() && (!client.Close())) {
        LOG_WARNING(subprocess) << "server did not acknowledge CLOSE";
    }
    return success;
}
