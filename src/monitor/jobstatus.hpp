/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_MONITOR_JOBSTATUS_HPP_
#define DEPLOYMON_MONITOR_JOBSTATUS_HPP_

#include <mutex>
#include <string>

namespace deploymon::monitor {

/**
 * Job status snapshot.
 */
struct JobStatusData {
    std::string mMessage;
    double      mPercent            = 0.0;
    bool        mError              = false;
    bool        mCompleted          = false;
    bool        mInstanceTerminated = false;
};

/**
 * Job progress sink.
 *
 * Written by the owning monitor only, read concurrently through snapshots.
 */
class JobStatus {
public:
    /**
     * Updates progress.
     *
     * @param message progress message.
     * @param percent progress percent.
     */
    void Update(const std::string& message, double percent);

    /**
     * Marks job as failed.
     *
     * @param message failure message.
     */
    void Fail(const std::string& message);

    /**
     * Marks job as successfully completed.
     *
     * @param message completion message.
     */
    void CompleteSuccessfully(const std::string& message);

    /**
     * Records that monitored instance was terminated.
     */
    void SetInstanceTerminated();

    /**
     * Returns true if job is failed.
     *
     * @return bool.
     */
    bool IsError() const;

    /**
     * Returns status snapshot.
     *
     * @return JobStatusData.
     */
    JobStatusData GetSnapshot() const;

private:
    static constexpr auto cMaxPercent = 100.0;

    mutable std::mutex mMutex;
    JobStatusData      mData;
};

} // namespace deploymon::monitor

#endif
