/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <lvi/Configuration.hpp>
#include <lvi/Logger.hpp>
#include <stdlib.h>
#include <string.h>

namespace lvi {

  Configuration configuration_from_env(Configuration base) {
    Configuration config = base;

    if (const char *mode = getenv("LVI_RESOLVE"); mode != nullptr) {
      if (strcmp(mode, "static") == 0) {
        config.mode = ResolveMode::Static;
      } else if (strcmp(mode, "dynamic") == 0) {
        config.mode = ResolveMode::Dynamic;
      } else if (strcmp(mode, "installed") == 0) {
        config.mode = ResolveMode::Installed;
      } else {
        log_warn("ignoring unknown LVI_RESOLVE mode '%s'", mode);
      }
    }

    if (const char *lib = getenv("LVI_HOST_LIBRARY"); lib != nullptr) {
      config.host_library = lib;
    }

    if (const char *names = getenv("LVI_REFNUM_SYMBOLS"); names != nullptr) {
      std::string *slots[] = {
          &config.refnum_symbols.new_ref,
          &config.refnum_symbols.lock_ref,
          &config.refnum_symbols.unlock_ref,
          &config.refnum_symbols.dispose_ref,
      };

      std::string list = names;
      size_t start = 0;
      for (size_t i = 0; i < 4; i++) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        *slots[i] = list.substr(start, comma - start);
        if (comma == list.size()) break;
        start = comma + 1;
      }
    }

    return config;
  }
}  // namespace lvi
