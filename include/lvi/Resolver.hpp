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

#include <lvi/Configuration.hpp>
#include <lvi/ManagerBinding.hpp>

namespace lvi {
  // Finding the host's entry points. None of these functions are called more
  // than once by the library itself: ManagerBinding::get() resolves exactly
  // once per process.
  namespace resolver {
    // Fill `table` according to `config`. Returns true when the memory
    // manager entry points were all found. Refnum entry points are filled in
    // independently and may remain null.
    bool resolve(const Configuration &config, ManagerTable &table);

    // The individual strategies.
    bool resolve_static(ManagerTable &table);
    bool resolve_dynamic(const Configuration &config, ManagerTable &table);
    void resolve_refnums(const Configuration &config, ManagerTable &table);
  }  // namespace resolver
}  // namespace lvi
