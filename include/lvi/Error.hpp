/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#pragma once

#include <stdint.h>
#include <string>
#include <lvi/MgError.hpp>

namespace lvi {

  enum class ErrorKind : uint8_t {
    AllocationFailed,
    ResizeFailed,
    InvalidHandle,
    ReferenceCreationFailed,
    LockFailed,
    UseAfterDispose,
    // The manager function table could not be resolved in this process.
    ManagerUnavailable,
  };

  const char *error_kind_name(ErrorKind kind);


  // Every failure surfaced by this library. `status` is whatever the host
  // manager returned, or mgNoErr when the failure was detected before the
  // host was asked anything.
  struct Error {
    ErrorKind kind;
    MgErr status = mgNoErr;

    Error(ErrorKind kind, MgErr status = mgNoErr)
        : kind(kind)
        , status(status) {}

    // The status to hand back to LabVIEW for this error.
    MgErr code(void) const { return status != mgNoErr ? status : (MgErr)bogusError; }

    // ex: "LockFailed (host status 1: mgArgErr)"
    std::string to_string(void) const;

    bool operator==(const Error &other) const {
      return kind == other.kind && status == other.status;
    }
    bool operator!=(const Error &other) const { return !(*this == other); }
  };
}  // namespace lvi
