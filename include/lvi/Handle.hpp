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
#include <stddef.h>
#include <type_traits>
#include <lvi/ManagerBinding.hpp>
#include <lvi/Logger.hpp>
#include <lvi/Result.hpp>
#include <lvi/utils.h>

namespace lvi {

  template <typename T>
  class LockedHandle;


  // An owning wrapper around one manager-allocated block of `T` elements.
  //
  // The manager may move the block whenever it is resized, so a Handle never
  // remembers where the data lives. The only way to reach the data is
  // `lock()`, which yields a LockedHandle valid for its own scope. The length
  // is likewise re-queried from the manager every time it is asked for.
  //
  // A Handle is the single owner of its raw handle: it cannot be copied, and
  // it disposes the block when destroyed unless `into_raw()` gave the block
  // back to the host first.
  template <typename T>
  class Handle final {
    static_assert(std::is_trivially_copyable<T>::value,
        "handle elements are moved around by the host as raw bytes");

   public:
    Handle(void) = default;

    Handle(Handle &&other) noexcept
        : m_raw(other.m_raw) {
      // A LockedHandle points at the Handle it came from, not at the block.
      LVI_ASSERT(other.m_locks == 0, "cannot move a handle while it is locked");
      other.m_raw = nullptr;
    }

    Handle &operator=(Handle &&other) noexcept {
      if (this != &other) {
        LVI_ASSERT(m_locks == 0 && other.m_locks == 0, "cannot move-assign a locked handle");
        reset();
        m_raw = other.m_raw;
        other.m_raw = nullptr;
      }
      return *this;
    }

    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;

    ~Handle(void) { reset(); }


    // Ask the manager for a new block of `count` elements.
    static Result<Handle<T>> allocate(size_t count) {
      if (count > SIZE_MAX / sizeof(T)) return Error(ErrorKind::AllocationFailed, mgArgErr);
      auto raw = ManagerBinding::get().allocate(count * sizeof(T));
      if (!raw) return raw.error();
      return Handle<T>(raw.take());
    }

    // Take ownership of a handle the host gave us. The caller promises that
    // nothing else owns `raw` and that it came from the host's manager.
    static Handle<T> from_raw(UHandle raw) { return Handle<T>(raw); }

    // Give the block back to the host without disposing it.
    UHandle into_raw(void) {
      LVI_ASSERT(m_locks == 0, "cannot release a handle while it is locked");
      UHandle out = m_raw;
      m_raw = nullptr;
      return out;
    }

    // Resize to `count` elements. The first min(len(), count) elements are
    // preserved. On failure the handle still wraps its old, valid block.
    Result<void> resize(size_t count) {
      if (m_raw == nullptr) return Error(ErrorKind::InvalidHandle);
      if (m_locks != 0) {
        log_warn("refusing to resize handle %p while it is locked", (void *)m_raw);
        return Error(ErrorKind::ResizeFailed, mgArgErr);
      }
      if (count > SIZE_MAX / sizeof(T)) return Error(ErrorKind::ResizeFailed, mgArgErr);
      return ManagerBinding::get().resize(m_raw, count * sizeof(T));
    }

    // Lock the block for direct access. Fails only if there is no block to
    // lock (a null handle or a null master pointer).
    Result<LockedHandle<T>> lock(void) {
      if (m_raw == nullptr || *m_raw == nullptr) return Error(ErrorKind::InvalidHandle);
      return LockedHandle<T>(*this, reinterpret_cast<T *>(*m_raw), len());
    }

    // The number of elements, as the manager currently sees it.
    size_t len(void) const {
      if (m_raw == nullptr) return 0;
      auto bytes = ManagerBinding::get().byte_size(m_raw);
      if (!bytes) {
        log_warn("size query on handle %p failed: %s", (void *)m_raw,
            bytes.error().to_string().c_str());
        return 0;
      }
      return bytes.value() / sizeof(T);
    }

    UHandle raw(void) const { return m_raw; }
    bool is_null(void) const { return m_raw == nullptr; }
    bool is_locked(void) const { return m_locks != 0; }

   private:
    friend class LockedHandle<T>;

    explicit Handle(UHandle raw)
        : m_raw(raw) {}

    void reset(void) {
      if (m_raw != nullptr) {
        LVI_SANITY(m_locks == 0, "disposing a handle that is still locked");
        ManagerBinding::get().dispose(m_raw);
        m_raw = nullptr;
      }
    }

    UHandle m_raw = nullptr;
    // How many LockedHandles currently borrow this handle.
    uint32_t m_locks = 0;
  };



  // A scoped view of a locked Handle. The parent refuses to resize or release
  // its block while any view is alive, so the pointer and the element count
  // captured at lock time stay valid until this is destroyed.
  template <typename T>
  class LockedHandle final {
   public:
    LockedHandle(LockedHandle &&other) noexcept
        : m_parent(other.m_parent)
        , m_data(other.m_data)
        , m_count(other.m_count) {
      other.m_parent = nullptr;
      other.m_data = nullptr;
      other.m_count = 0;
    }

    LockedHandle(const LockedHandle &) = delete;
    LockedHandle &operator=(const LockedHandle &) = delete;
    LockedHandle &operator=(LockedHandle &&) = delete;

    ~LockedHandle(void) { unlock(); }

    T *data(void) const { return m_data; }
    size_t size(void) const { return m_count; }
    bool empty(void) const { return m_count == 0; }

    T &operator[](size_t i) const {
      LVI_SANITY(i < m_count, "index %zu out of range for a handle of %zu elements", i, m_count);
      return m_data[i];
    }

    T *begin(void) const { return m_data; }
    T *end(void) const { return m_data + m_count; }

    uint8_t *bytes(void) const { return reinterpret_cast<uint8_t *>(m_data); }
    size_t byte_size(void) const { return m_count * sizeof(T); }

   private:
    friend class Handle<T>;

    LockedHandle(Handle<T> &parent, T *data, size_t count)
        : m_parent(&parent)
        , m_data(data)
        , m_count(count) {
      m_parent->m_locks++;
    }

    // Handles need no host call to unlock; only the borrow is given back.
    void unlock(void) {
      if (m_parent != nullptr) {
        m_parent->m_locks--;
        m_parent = nullptr;
      }
    }

    Handle<T> *m_parent;
    T *m_data;
    size_t m_count;
  };
}  // namespace lvi
