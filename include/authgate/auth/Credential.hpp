//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/authgate/auth/Credential.hpp
// Purpose: Opaque credential capability
//==========================================================================================================
#pragma once

#include <memory>

namespace authgate::auth {

class ICredential {
public:
    virtual ~ICredential() = default;

    // True when the credential must be refreshed before it can authenticate another request
    virtual bool requiresRefresh() const = 0;
};

// Credentials are immutable once published; a refresh replaces the pointer, never the pointee.
using CredentialPtr = std::shared_ptr<const ICredential>;

} // namespace authgate::auth
