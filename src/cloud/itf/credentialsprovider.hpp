/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef DEPLOYMON_CLOUD_ITF_CREDENTIALSPROVIDER_HPP_
#define DEPLOYMON_CLOUD_ITF_CREDENTIALSPROVIDER_HPP_

#include <cloud/awssigner.hpp>

namespace deploymon::cloud {

/**
 * Credentials provider interface.
 */
class CredentialsProviderItf {
public:
    /**
     * Returns credentials valid for signing next request.
     *
     * @return RetWithError<Credentials>.
     */
    virtual RetWithError<Credentials> GetCredentials() = 0;

    /**
     * Destructor.
     */
    virtual ~CredentialsProviderItf() = default;
};

} // namespace deploymon::cloud

#endif
