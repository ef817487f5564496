/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <lvi/ManagerBinding.hpp>
#include <lvi/Resolver.hpp>
#include <lvi/Logger.hpp>
#include <stdint.h>
#include <mutex>

namespace lvi {

  bool ManagerTable::has_memory_api(void) const {
    return new_handle != nullptr && set_handle_size != nullptr && get_handle_size != nullptr &&
           dispose_handle != nullptr && move_block != nullptr && numeric_array_resize != nullptr;
  }

  bool ManagerTable::has_refnum_api(void) const {
    return new_ref != nullptr && lock_ref != nullptr && unlock_ref != nullptr &&
           dispose_ref != nullptr;
  }



  // Process-wide state. `the_binding` is written exactly once, inside
  // `resolve_once`, and only read afterwards.
  static std::once_flag resolve_once;
  static ManagerBinding *the_binding = nullptr;

  static std::mutex config_lock;
  static bool config_frozen = false;
  static Configuration pending_config;


  // Called once, under `resolve_once`.
  static void publish(const ManagerTable &table, const char *how) {
    // Never freed: plugins are unloaded with the process.
    the_binding = new ManagerBinding(table);

    if (the_binding->memory_ready()) {
      log_info("memory manager bound (%s)", how);
    } else {
      log_error("memory manager could not be bound (%s); handle operations will fail", how);
    }
    if (!the_binding->refnums_ready()) {
      log_info("refnum entry points not bound (%s); refnum operations will fail", how);
    }
  }


  static Configuration freeze_config(void) {
    std::lock_guard<std::mutex> guard(config_lock);
    config_frozen = true;
    return configuration_from_env(pending_config);
  }


  ManagerBinding::ManagerBinding(const ManagerTable &table)
      : m_table(table)
      , m_memory_ready(table.has_memory_api())
      , m_refnums_ready(table.has_refnum_api()) {}


  ManagerBinding &ManagerBinding::get(void) {
    std::call_once(resolve_once, [] {
      Configuration config = freeze_config();
      ManagerTable table;
      resolver::resolve(config, table);
      publish(table, config.mode == ResolveMode::Static    ? "static"
                     : config.mode == ResolveMode::Dynamic ? "dynamic"
                                                           : "installed");
    });
    return *the_binding;
  }


  bool ManagerBinding::install(const ManagerTable &table) {
    bool installed = false;
    std::call_once(resolve_once, [&] {
      freeze_config();
      publish(table, "installed");
      installed = true;
    });

    if (!installed) log_warn("manager binding already resolved; install() ignored");
    return installed;
  }


  bool ManagerBinding::configure(const Configuration &config) {
    std::lock_guard<std::mutex> guard(config_lock);
    if (config_frozen) {
      log_warn("manager binding already resolved; configure() ignored");
      return false;
    }
    pending_config = config;
    return true;
  }



  Result<UHandle> ManagerBinding::allocate(size_t byte_size) const {
    if (!m_memory_ready) return Error(ErrorKind::ManagerUnavailable);
    if (byte_size > INT32_MAX) return Error(ErrorKind::AllocationFailed, mgArgErr);

    UHandle h = m_table.new_handle((uint32_t)byte_size);
    if (h == nullptr) {
      log_debug("manager refused to allocate %zu bytes", byte_size);
      return Error(ErrorKind::AllocationFailed, mFullErr);
    }
    return h;
  }


  Result<void> ManagerBinding::resize(UHandle h, size_t new_byte_size) const {
    if (!m_memory_ready) return Error(ErrorKind::ManagerUnavailable);
    if (h == nullptr) return Error(ErrorKind::InvalidHandle);
    if (new_byte_size > INT32_MAX) return Error(ErrorKind::ResizeFailed, mgArgErr);

    MgErr err = m_table.set_handle_size(h, (uint32_t)new_byte_size);
    if (err != mgNoErr) {
      log_debug("manager refused to resize %p to %zu bytes: %d", (void *)h, new_byte_size, err);
      return Error(ErrorKind::ResizeFailed, err);
    }
    return {};
  }


  Result<size_t> ManagerBinding::byte_size(UHandle h) const {
    if (!m_memory_ready) return Error(ErrorKind::ManagerUnavailable);
    if (h == nullptr) return Error(ErrorKind::InvalidHandle);

    int32_t size = m_table.get_handle_size(h);
    if (size < 0) return Error(ErrorKind::InvalidHandle, mZoneErr);
    return (size_t)size;
  }


  void ManagerBinding::dispose(UHandle h) const {
    if (h == nullptr) return;
    if (!m_memory_ready) {
      log_warn("cannot dispose handle %p: no memory manager bound", (void *)h);
      return;
    }

    MgErr err = m_table.dispose_handle(h);
    if (err != mgNoErr) {
      log_warn("disposing handle %p failed: %d (%s)", (void *)h, err, mg_error_name(err));
    }
  }


  void ManagerBinding::move_block(const void *src, void *dst, size_t byte_size) const {
    if (byte_size == 0) return;
    if (!m_memory_ready) {
      log_warn("cannot move %zu bytes: no memory manager bound", byte_size);
      return;
    }
    m_table.move_block(src, dst, byte_size);
  }


  Result<void> ManagerBinding::numeric_array_resize(
      int32_t type_code, int32_t num_dims, UHandle *hp, size_t element_count) const {
    if (!m_memory_ready) return Error(ErrorKind::ManagerUnavailable);
    if (hp == nullptr) return Error(ErrorKind::InvalidHandle);

    MgErr err = m_table.numeric_array_resize(type_code, num_dims, hp, element_count);
    if (err != mgNoErr) {
      log_debug("manager refused to resize array %p to %zu elements: %d", (void *)*hp,
          element_count, err);
      return Error(ErrorKind::ResizeFailed, err);
    }
    return {};
  }



  Result<LVRefNum> ManagerBinding::new_ref(const LVRefDescriptor &desc) const {
    if (!m_refnums_ready) return Error(ErrorKind::ManagerUnavailable);

    LVRefNum out = 0;
    MgErr err = m_table.new_ref(&desc, &out);
    if (err != mgNoErr) return Error(ErrorKind::ReferenceCreationFailed, err);
    return out;
  }


  Result<void *> ManagerBinding::lock_ref(LVRefNum ref) const {
    if (!m_refnums_ready) return Error(ErrorKind::ManagerUnavailable);

    void *payload = nullptr;
    MgErr err = m_table.lock_ref(ref, &payload);
    if (err != mgNoErr) return Error(ErrorKind::LockFailed, err);
    return payload;
  }


  void ManagerBinding::unlock_ref(LVRefNum ref) const {
    if (!m_refnums_ready) {
      log_warn("cannot unlock refnum %u: no refnum entry points bound", ref);
      return;
    }

    MgErr err = m_table.unlock_ref(ref);
    if (err != mgNoErr) {
      log_warn("unlocking refnum %u failed: %d (%s)", ref, err, mg_error_name(err));
    }
  }


  void ManagerBinding::dispose_ref(LVRefNum ref) const {
    if (!m_refnums_ready) {
      log_warn("cannot dispose refnum %u: no refnum entry points bound", ref);
      return;
    }

    MgErr err = m_table.dispose_ref(ref);
    if (err != mgNoErr) {
      log_warn("disposing refnum %u failed: %d (%s)", ref, err, mg_error_name(err));
    }
  }
}  // namespace lvi
