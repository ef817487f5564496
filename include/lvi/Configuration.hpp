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

#include <string>

namespace lvi {

  // How the manager function table is obtained.
  enum class ResolveMode {
    // Take the addresses of the host exports the plugin was linked against.
    // Requires a build with LVI_LINK_HOST.
    Static,
    // Look the exports up in the running process, then in `host_library`.
    Dynamic,
    // Only accept a table handed to ManagerBinding::install().
    Installed,
  };

  // LabVIEW has no fixed C names for the refnum primitives, so the embedder
  // names them. An empty name leaves that primitive unresolved.
  struct RefnumSymbols {
    std::string new_ref;
    std::string lock_ref;
    std::string unlock_ref;
    std::string dispose_ref;
  };

  // This structure is threaded through the resolution of the manager binding
  // to allow configuration of where the host's entry points come from.
  struct Configuration {
    ResolveMode mode = ResolveMode::Dynamic;

    // Library to dlopen when the exports are not already visible in the
    // process. Empty means "only search the process".
    std::string host_library;

    RefnumSymbols refnum_symbols;
  };

  // Apply the environment on top of `base`:
  //   LVI_RESOLVE=static|dynamic|installed
  //   LVI_HOST_LIBRARY=<path>
  //   LVI_REFNUM_SYMBOLS=<new>,<lock>,<unlock>,<dispose>
  Configuration configuration_from_env(Configuration base = {});
}  // namespace lvi
