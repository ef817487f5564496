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

#include <stddef.h>
#include <lvi/host_api.h>
#include <lvi/Configuration.hpp>
#include <lvi/Result.hpp>

namespace lvi {

  // The host's memory manager and refnum entry points. Any of these may be
  // null if they could not be resolved.
  struct ManagerTable {
    UHandle (*new_handle)(uint32_t size) = nullptr;
    MgErr (*set_handle_size)(UHandle h, uint32_t size) = nullptr;
    int32_t (*get_handle_size)(UHandle h) = nullptr;
    MgErr (*dispose_handle)(UHandle h) = nullptr;
    void (*move_block)(const void *src, void *dst, size_t size) = nullptr;
    MgErr (*numeric_array_resize)(int32_t type_code, int32_t num_dims, UHandle *hp,
        size_t new_size) = nullptr;

    MgErr (*new_ref)(const LVRefDescriptor *desc, LVRefNum *out) = nullptr;
    MgErr (*lock_ref)(LVRefNum ref, void **payload) = nullptr;
    MgErr (*unlock_ref)(LVRefNum ref) = nullptr;
    MgErr (*dispose_ref)(LVRefNum ref) = nullptr;

    // Are all six memory manager entry points present?
    bool has_memory_api(void) const;
    // Are all four refnum entry points present?
    bool has_refnum_api(void) const;
  };


  /**
   * @brief ManagerBinding is the only path from this library into the host.
   *
   * It translates the host's status codes into lvi::Error values and keeps no
   * state of its own beyond the function table. The process-wide instance is
   * resolved once, on first use (see `get()`), and is immutable afterwards.
   * Separate instances can be built around an arbitrary table, which is how
   * the tests exercise the translation logic without touching the global one.
   *
   * `dispose`, `unlock_ref` and `dispose_ref` never report failure: they run
   * on cleanup paths. A failing status there is logged and dropped.
   */
  class ManagerBinding final {
   public:
    explicit ManagerBinding(const ManagerTable &table);

    // Return the process-wide binding, resolving it on the first call.
    static ManagerBinding &get(void);

    // Provide the table explicitly. Only succeeds if the global binding has
    // not been resolved yet.
    static bool install(const ManagerTable &table);

    // Choose how the global binding will be resolved. Only succeeds if the
    // global binding has not been resolved yet.
    static bool configure(const Configuration &config);

    bool memory_ready(void) const { return m_memory_ready; }
    bool refnums_ready(void) const { return m_refnums_ready; }

    Result<UHandle> allocate(size_t byte_size) const;
    Result<void> resize(UHandle h, size_t new_byte_size) const;
    Result<size_t> byte_size(UHandle h) const;
    void dispose(UHandle h) const;
    void move_block(const void *src, void *dst, size_t byte_size) const;
    // Resize the array behind `*hp` (allocating it if `*hp` is null) to hold
    // `element_count` elements of the numeric type `type_code`. The host may
    // replace `*hp`.
    Result<void> numeric_array_resize(
        int32_t type_code, int32_t num_dims, UHandle *hp, size_t element_count) const;

    Result<LVRefNum> new_ref(const LVRefDescriptor &desc) const;
    Result<void *> lock_ref(LVRefNum ref) const;
    void unlock_ref(LVRefNum ref) const;
    void dispose_ref(LVRefNum ref) const;

   private:
    ManagerTable m_table;
    bool m_memory_ready;
    bool m_refnums_ready;
  };
}  // namespace lvi
