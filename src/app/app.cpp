/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <execinfo.h>
#include <iostream>

#include <Poco/Net/SSLManager.h>
#include <Poco/Process.h>
#include <Poco/Util/HelpFormatter.h>
#include <systemd/sd-daemon.h>

#include <core/common/version/version.hpp>

#include <common/logger/logmodule.hpp>
#include <common/utils/exception.hpp>
#include <common/version/version.hpp>

#include "app.hpp"

namespace deploymon::app {

namespace {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

void ErrorHandler(int sig)
{
    static constexpr auto cBacktraceSize = 32;

    void*  array[cBacktraceSize];
    size_t size;

    switch (sig) {
    case SIGILL:
        std::cerr << "Illegal instruction" << std::endl;
        break;

    case SIGABRT:
        std::cerr << "Aborted" << std::endl;
        break;

    case SIGFPE:
        std::cerr << "Floating point exception" << std::endl;
        break;

    case SIGSEGV:
        std::cerr << "Segmentation fault" << std::endl;
        break;

    default:
        std::cerr << "Unknown signal" << std::endl;
        break;
    }

    size = backtrace(array, cBacktraceSize);

    backtrace_symbols_fd(array, size, STDERR_FILENO);

    raise(sig);
}

void RegisterErrorSignals()
{
    struct sigaction act { };

    act.sa_handler = ErrorHandler;
    act.sa_flags   = SA_RESETHAND;

    sigaction(SIGILL, &act, nullptr);
    sigaction(SIGABRT, &act, nullptr);
    sigaction(SIGFPE, &act, nullptr);
    sigaction(SIGSEGV, &act, nullptr);
}

// Monitor threads inherit the mask, termination signals are consumed by waitForTerminationRequest only.
void BlockTerminationSignals()
{
    sigset_t sset;

    sigemptyset(&sset);
    sigaddset(&sset, SIGINT);
    sigaddset(&sset, SIGQUIT);
    sigaddset(&sset, SIGTERM);

    if (auto ret = pthread_sigmask(SIG_BLOCK, &sset, nullptr); ret != 0) {
        DEPLOYMON_ERROR_THROW(Error(ret), "can't block termination signals");
    }
}

} // namespace

/***********************************************************************************************************************
 * Protected
 **********************************************************************************************************************/

void App::initialize(Application& self)
{
    if (mStopProcessing) {
        return;
    }

    RegisterErrorSignals();

    try {
        auto err = mLogger.Init();
        DEPLOYMON_ERROR_CHECK_AND_THROW(err, "can't initialize logger");

        Application::initialize(self);

        Poco::Net::initializeSSL();

        LOG_INF() << "Init deploymon" << Log::Field("version", DEPLOYMON_VERSION);

        mDeploymonCore = std::make_unique<DeploymonCore>();

        mDeploymonCore->Init(mConfigFile);

        BlockTerminationSignals();

        mDeploymonCore->Start();

        mInitialized = true;

        mWaitThread = std::thread(&App::WaitMonitors, this);
    } catch (const std::exception& e) {
        LOG_ERR() << "Initialization failed" << Log::Field(common::utils::ToAosError(e));

        throw;
    }

    // Notify systemd
    if (auto ret = sd_notify(0, cSDNotifyReady); ret < 0) {
        LOG_WRN() << "Can't notify systemd" << Log::Field(AOS_ERROR_WRAP(Error(ret)));
    }
}

void App::uninitialize()
{
    Application::uninitialize();

    if (mWaitThread.joinable()) {
        mWaitThread.join();
    }

    mDeploymonCore.reset();

    Poco::Net::uninitializeSSL();
}

int App::main(const ArgVec& args)
{
    (void)args;

    if (mStopProcessing) {
        return Application::EXIT_OK;
    }

    if (!mInitialized) {
        return Application::EXIT_SOFTWARE;
    }

    waitForTerminationRequest();

    if (!mMonitorsFinished) {
        LOG_WRN() << "Termination requested, cancel running monitors";
    }

    mDeploymonCore->Stop();

    if (mWaitThread.joinable()) {
        mWaitThread.join();
    }

    return mDeploymonCore->ReportResults() ? Application::EXIT_OK : Application::EXIT_SOFTWARE;
}

void App::defineOptions(Poco::Util::OptionSet& options)
{
    Application::defineOptions(options);

    options.addOption(Poco::Util::Option("help", "h", "displays help information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleHelp)));
    options.addOption(Poco::Util::Option("config", "c", "path to config file")
                          .argument("${file}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleConfigFile)));
    options.addOption(Poco::Util::Option("verbose", "v", "sets current log level")
                          .argument("${level}")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleLogLevel)));
    options.addOption(Poco::Util::Option("version", "", "displays version information")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleVersion)));
    options.addOption(Poco::Util::Option("journal", "j", "redirects logs to systemd journal")
                          .callback(Poco::Util::OptionCallback<App>(this, &App::HandleJournal)));
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

void App::WaitMonitors()
{
    mDeploymonCore->Wait();

    mMonitorsFinished = true;

    LOG_DBG() << "All monitors finished";

    // Wakes up waitForTerminationRequest in main thread.
    Poco::Process::requestTermination(Poco::Process::id());
}

void App::HandleHelp(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    Poco::Util::HelpFormatter helpFormatter(options());

    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("[OPTIONS]");
    helpFormatter.setHeader("OTP server deployment monitor.");
    helpFormatter.format(std::cout);

    stopOptionsProcessing();
}

void App::HandleConfigFile(const std::string& name, const std::string& value)
{
    (void)name;

    mConfigFile = value;
}

void App::HandleLogLevel(const std::string& name, const std::string& value)
{
    (void)name;

    LogLevel level;

    auto err = level.FromString(aos::String(value.c_str()));
    if (!err.IsNone()) {
        throw Poco::Exception("unsupported log level", value);
    }

    mLogger.SetLogLevel(level);
}

void App::HandleVersion(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mStopProcessing = true;

    std::cout << "Deploymon version:        " << DEPLOYMON_VERSION << std::endl;
    std::cout << "Aos core library version: " << AOS_CORE_LIB_VERSION << std::endl;

    stopOptionsProcessing();
}

void App::HandleJournal(const std::string& name, const std::string& value)
{
    (void)name;
    (void)value;

    mLogger.SetBackend(common::logger::Logger::Backend::eJournald);
}

} // namespace deploymon::app
