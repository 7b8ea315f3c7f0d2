/**
 * @file CftpServerRunner.cpp
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

#include "CftpServerRunner.h"
#include "TransferServerController.h"
#include "DownloadManager.h"
#include "ControlApi.h"
#include "ControlHttpServer.h"
#include "ContentDigest.h"
#include "SignalHandler.h"
#include "Logger.h"
#include <boost/bind/bind.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread.hpp>

static constexpr cftp::Logger::SubProcess subprocess = cftp::Logger::SubProcess::none;

void CftpServerRunner::MonitorExitKeypressThreadFunction() {
    LOG_INFO(subprocess) << "Keyboard Interrupt.. exiting";
    m_runningFromSigHandler = false; //do this first
}


CftpServerRunner::CftpServerRunner() {}
CftpServerRunner::~CftpServerRunner() {}

bool CftpServerRunner::ApplyCommandLineOverrides(const boost::program_options::variables_map& vm, TransferServerConfig& config) {
    if (vm.count("root-dir")) {
        config.m_rootDir = vm["root-dir"].as<std::string>();
    }
    if (vm.count("temp-dir")) {
        config.m_tempDir = vm["temp-dir"].as<std::string>();
    }
    if (vm.count("port")) {
        config.m_port = vm["port"].as<uint16_t>();
    }
    if (vm.count("server-type")) {
        //a new server type brings its own io mode
        config.m_serverType = vm["server-type"].as<std::string>();
        config.m_ioMode = TransferServerConfig::GetDefaultIoModeForServerType(config.m_serverType);
    }
    return config.Validate();
}

bool CftpServerRunner::Run(int argc, const char* const argv[], std::atomic<bool>& running, bool useSignalHandler) {
    //scope to ensure clean exit before return 0
    {
        running = true;
        m_runningFromSigHandler = true;
        SignalHandler sigHandler(boost::bind(&CftpServerRunner::MonitorExitKeypressThreadFunction, this));
        TransferServerConfig config;
        uint16_t controlPort;
        std::string controlAddress;
        boost::filesystem::path saveDirectory;
        bool autoStart;

        boost::program_options::options_description desc("Allowed options");
        try {
            desc.add_options()
                ("help", "Produce help message.")
                ("server-config-file", boost::program_options::value<boost::filesystem::path>()->default_value(""), "Transfer server JSON configuration file (command line options override it).")
                ("root-dir", boost::program_options::value<std::string>(), "Directory served to clients.")
                ("temp-dir", boost::program_options::value<std::string>(), "Directory for partial files.")
                ("port", boost::program_options::value<uint16_t>(), "Transfer server TCP port (0 => ephemeral).")
                ("server-type", boost::program_options::value<std::string>(), "sequential, threaded, multiplexed or async.")
                ("control-port", boost::program_options::value<uint16_t>()->default_value(8012), "HTTP control interface port (0 => disabled).")
                ("control-address", boost::program_options::value<std::string>()->default_value("0.0.0.0"), "HTTP control interface bind address.")
                ("save-dir", boost::program_options::value<boost::filesystem::path>()->default_value("./client_files"), "Directory for downloads requested through the control interface.")
                ("no-autostart", "Wait for a /server/start control request instead of starting the transfer server.")
                ;

            boost::program_options::variables_map vm;
            boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc, boost::program_options::command_line_style::unix_style | boost::program_options::command_line_style::case_insensitive), vm);
            boost::program_options::notify(vm);

            if (vm.count("help")) {
                LOG_INFO(subprocess) << desc;
                return false;
            }

            const boost::filesystem::path configFileName = vm["server-config-file"].as<boost::filesystem::path>();
            if (!configFileName.empty()) {
                TransferServerConfig_ptr configPtr = TransferServerConfig::CreateFromJsonFilePath(configFileName);
                if (!configPtr) {
                    LOG_ERROR(subprocess) << "error loading config file: " << configFileName;
                    return false;
                }
                config = *configPtr;
            }
            if (!ApplyCommandLineOverrides(vm, config)) {
                LOG_ERROR(subprocess) << "invalid transfer server configuration";
                return false;
            }
            controlPort = vm["control-port"].as<uint16_t>();
            controlAddress = vm["control-address"].as<std::string>();
            saveDirectory = vm["save-dir"].as<boost::filesystem::path>();
            autoStart = (vm.count("no-autostart") == 0);
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

        LOG_INFO(subprocess) << "starting..";
        DIGEST_ALGORITHM digestAlgorithm = DIGEST_ALGORITHM::MD5;
        if (!ContentDigest::GetAlgorithmFromString(config.m_digestAlgorithm, digestAlgorithm)) {
            LOG_FATAL(subprocess) << "unknown digest algorithm " << config.m_digestAlgorithm;
            return false;
        }
        TransferServerController controller;
        DownloadManager downloadManager(saveDirectory, saveDirectory / ".partial", digestAlgorithm);
        downloadManager.SetRemoteServer("127.0.0.1", static_cast<uint16_t>(config.m_port));
        downloadManager.Start();
        ControlApi controlApi(controller, downloadManager);
        ControlHttpServer controlHttpServer;

        if (autoStart) {
            const SERVER_START_RESULT result = controller.Start(config);
            if (result != SERVER_START_RESULT::STARTED) {
                LOG_FATAL(subprocess) << "Cannot start transfer server: " << TransferServerController::StartResultToString(result);
                return false;
            }
            downloadManager.SetRemoteServer("127.0.0.1", controller.GetStatus().port);
        }
        if (controlPort != 0) {
            if (!controlHttpServer.Init(controlAddress, controlPort, controlApi)) {
                LOG_FATAL(subprocess) << "Cannot Init control interface on port " << controlPort;
                return false;
            }
        }
        else if (!autoStart) {
            LOG_WARNING(subprocess) << "no control interface and no autostart: nothing to do until interrupted";
        }

        if (useSignalHandler) {
            sigHandler.Start(false);
        }
        LOG_INFO(subprocess) << "Up and running";
        while (running && m_runningFromSigHandler) {
            boost::this_thread::sleep(boost::posix_time::millisec(250));
            if (useSignalHandler) {
                sigHandler.PollOnce();
            }
        }

        LOG_INFO(subprocess) << "Exiting cleanly..";
        controlHttpServer.Stop();
        downloadManager.Stop();
        controller.Stop();
    }
    LOG_INFO(subprocess) << "Exited cleanly";
    return true;
}
