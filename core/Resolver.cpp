/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <lvi/Resolver.hpp>
#include <lvi/Logger.hpp>
#include <dlfcn.h>

namespace lvi::resolver {

  // The host library handle, if we had to open one. Kept open for the life
  // of the process since the table points into it.
  static void *host_library = nullptr;


  static void *open_host_library(const Configuration &config) {
    if (host_library != nullptr) return host_library;
    if (config.host_library.empty()) return nullptr;

    host_library = dlopen(config.host_library.c_str(), RTLD_NOW | RTLD_GLOBAL);
    if (host_library == nullptr) {
      log_error("could not open host library '%s': %s", config.host_library.c_str(), dlerror());
    }
    return host_library;
  }


  // Look `name` up in the process first, then in the configured host library.
  static void *lookup(const Configuration &config, const char *name) {
    void *sym = dlsym(RTLD_DEFAULT, name);
    if (sym != nullptr) return sym;

    if (void *lib = open_host_library(config); lib != nullptr) {
      sym = dlsym(lib, name);
    }
    if (sym == nullptr) log_debug("host symbol %s not found", name);
    return sym;
  }


  template <typename Fn>
  static void bind(const Configuration &config, Fn *&slot, const char *name) {
    slot = reinterpret_cast<Fn *>(lookup(config, name));
  }



  bool resolve_static(ManagerTable &table) {
#ifdef LVI_LINK_HOST
    table.new_handle = &DSNewHandle;
    table.set_handle_size = &DSSetHandleSize;
    table.get_handle_size = &DSGetHandleSize;
    table.dispose_handle = &DSDisposeHandle;
    table.move_block = &MoveBlock;
    table.numeric_array_resize = &NumericArrayResize;
    return true;
#else
    (void)table;
    log_error("static resolution requested, but this build was not linked against the host");
    return false;
#endif
  }


  bool resolve_dynamic(const Configuration &config, ManagerTable &table) {
    bind(config, table.new_handle, "DSNewHandle");
    bind(config, table.set_handle_size, "DSSetHandleSize");
    bind(config, table.get_handle_size, "DSGetHandleSize");
    bind(config, table.dispose_handle, "DSDisposeHandle");
    bind(config, table.move_block, "MoveBlock");
    bind(config, table.numeric_array_resize, "NumericArrayResize");

    if (!table.has_memory_api()) {
      log_error("the memory manager is not exported by this process%s%s",
          config.host_library.empty() ? "" : " or by ", config.host_library.c_str());
      // Half a memory manager is no memory manager.
      table.new_handle = nullptr;
      table.set_handle_size = nullptr;
      table.get_handle_size = nullptr;
      table.dispose_handle = nullptr;
      table.move_block = nullptr;
      table.numeric_array_resize = nullptr;
      return false;
    }
    return true;
  }


  void resolve_refnums(const Configuration &config, ManagerTable &table) {
    const RefnumSymbols &names = config.refnum_symbols;
    if (names.new_ref.empty() || names.lock_ref.empty() || names.unlock_ref.empty() ||
        names.dispose_ref.empty()) {
      log_debug("refnum symbols not configured");
      return;
    }

    bind(config, table.new_ref, names.new_ref.c_str());
    bind(config, table.lock_ref, names.lock_ref.c_str());
    bind(config, table.unlock_ref, names.unlock_ref.c_str());
    bind(config, table.dispose_ref, names.dispose_ref.c_str());

    if (!table.has_refnum_api()) {
      log_warn("only some of the configured refnum symbols were found; refnums disabled");
      table.new_ref = nullptr;
      table.lock_ref = nullptr;
      table.unlock_ref = nullptr;
      table.dispose_ref = nullptr;
    }
  }


  bool resolve(const Configuration &config, ManagerTable &table) {
    table = ManagerTable{};

    bool found = false;
    switch (config.mode) {
      case ResolveMode::Static:
        found = resolve_static(table);
        break;
      case ResolveMode::Dynamic:
        found = resolve_dynamic(config, table);
        break;
      case ResolveMode::Installed:
        log_error("manager binding is set to 'installed' but nothing was installed");
        return false;
    }

    resolve_refnums(config, table);
    return found;
  }
}  // namespace lvi::resolver
