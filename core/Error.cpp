/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <lvi/Error.hpp>
#include <lvi/LVRef.hpp>
#include <stdio.h>

namespace lvi {
  const char *mg_error_name(MgErr status) {
    switch (status) {
      case mgNoErr:
        return "mgNoErr";
      case mgArgErr:
        return "mgArgErr";
      case mFullErr:
        return "mFullErr";
      case mZoneErr:
        return "mZoneErr";
      case bogusError:
        return "bogusError";
      default:
        return "unknown";
    }
  }


  const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
      case ErrorKind::AllocationFailed:
        return "AllocationFailed";
      case ErrorKind::ResizeFailed:
        return "ResizeFailed";
      case ErrorKind::InvalidHandle:
        return "InvalidHandle";
      case ErrorKind::ReferenceCreationFailed:
        return "ReferenceCreationFailed";
      case ErrorKind::LockFailed:
        return "LockFailed";
      case ErrorKind::UseAfterDispose:
        return "UseAfterDispose";
      case ErrorKind::ManagerUnavailable:
        return "ManagerUnavailable";
    }
    return "Unknown";
  }


  std::string Error::to_string(void) const {
    if (status == mgNoErr) return error_kind_name(kind);

    char buf[96];
    snprintf(buf, sizeof(buf), "%s (host status %d: %s)", error_kind_name(kind), (int)status,
        mg_error_name(status));
    return buf;
  }


  const char *ref_state_name(RefState state) {
    switch (state) {
      case RefState::Created:
        return "Created";
      case RefState::Locked:
        return "Locked";
      case RefState::Released:
        return "Released";
      case RefState::Disposed:
        return "Disposed";
    }
    return "Unknown";
  }
}  // namespace lvi
