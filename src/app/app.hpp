/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_APP_APP_HPP_
#define DEPLOYMON_APP_APP_HPP_

#include <atomic>
#include <memory>
#include <thread>

#include <Poco/Util/ServerApplication.h>

#include <common/logger/logger.hpp>

#include "deploymoncore.hpp"

namespace deploymon::app {

/**
 * Deploymon application.
 */
class App : public Poco::Util::ServerApplication {
public:
    /**
     * Constructor.
     */
    App() = default;

protected:
    void initialize(Application& self) override;
    void uninitialize() override;
    int  main(const ArgVec& args) override;
    void defineOptions(Poco::Util::OptionSet& options) override;

private:
    static constexpr auto cSDNotifyReady = "READY=1";

    void HandleHelp(const std::string& name, const std::string& value);
    void HandleConfigFile(const std::string& name, const std::string& value);
    void HandleLogLevel(const std::string& name, const std::string& value);
    void HandleVersion(const std::string& name, const std::string& value);
    void HandleJournal(const std::string& name, const std::string& value);

    void WaitMonitors();

    std::unique_ptr<DeploymonCore> mDeploymonCore;
    common::logger::Logger         mLogger;
    std::thread                    mWaitThread;
    std::atomic<bool>              mMonitorsFinished {};
    bool                           mStopProcessing {};
    bool                           mInitialized {};
    std::string                    mConfigFile;
};

} // namespace deploymon::app

#endif
