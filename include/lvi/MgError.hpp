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

#include <lvi/host_api.h>

namespace lvi {

  // The memory manager status codes this library produces or inspects.
  enum MgError : MgErr {
    mgNoErr = 0,
    mgArgErr = 1,   // An input parameter is invalid
    mFullErr = 2,   // Memory is full
    mZoneErr = 3,   // Not a valid handle or pointer
    bogusError = 42,  // Generic error
  };

  // A short name for a status, or "unknown" for codes not listed above.
  const char *mg_error_name(MgErr status);
}  // namespace lvi
