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
#include <type_traits>
#include <lvi/ManagerBinding.hpp>
#include <lvi/Logger.hpp>
#include <lvi/Result.hpp>
#include <lvi/utils.h>

namespace lvi {

  // Where an LVRef is in its life. Disposed is terminal.
  enum class RefState : uint8_t {
    Created,   // Never locked
    Locked,    // At least one LockedRef is alive
    Released,  // Was locked, every lock has been given back
    Disposed,  // Disposed, moved from, or handed back to the host
  };

  const char *ref_state_name(RefState state);


  template <typename T>
  class LockedRef;


  // An owning wrapper around a host refnum whose payload is a T.
  //
  // The payload belongs to the host. This wrapper never touches it except
  // through a LockedRef, which is the only way to obtain a pointer to it and
  // which unlocks the refnum when it goes out of scope. Any operation after
  // the refnum has been disposed is refused here, without asking the host.
  template <typename T>
  class LVRef final {
    static_assert(std::is_trivially_copyable<T>::value,
        "refnum payloads are copied into host storage as raw bytes");

   public:
    LVRef(LVRef &&other) noexcept
        : m_refnum(other.m_refnum)
        , m_state(other.m_state) {
      // A LockedRef unlocks through the LVRef it came from.
      LVI_ASSERT(other.m_locks == 0, "cannot move refnum %u while it is locked", other.m_refnum);
      other.m_refnum = 0;
      other.m_state = RefState::Disposed;
    }

    LVRef &operator=(LVRef &&other) noexcept {
      if (this != &other) {
        LVI_ASSERT(m_locks == 0 && other.m_locks == 0, "cannot move-assign a locked refnum");
        dispose();
        m_refnum = other.m_refnum;
        m_state = other.m_state;
        m_dispose_pending = false;
        other.m_refnum = 0;
        other.m_state = RefState::Disposed;
      }
      return *this;
    }

    LVRef(const LVRef &) = delete;
    LVRef &operator=(const LVRef &) = delete;

    ~LVRef(void) {
      LVI_SANITY(m_locks == 0, "refnum %u destroyed while still locked", m_refnum);
      dispose();
    }


    // Create a new refnum whose payload starts out as a copy of `initial`.
    static Result<LVRef<T>> create(const T &initial) {
      LVRefDescriptor desc;
      desc.payload_size = sizeof(T);
      desc.initial_payload = &initial;
      desc.cleanup = nullptr;
      return create(desc);
    }

    // Create a new refnum from a caller-built descriptor, ex. to register a
    // cleanup callback with the host.
    static Result<LVRef<T>> create(const LVRefDescriptor &desc) {
      if (desc.payload_size < sizeof(T)) return Error(ErrorKind::ReferenceCreationFailed, mgArgErr);
      auto refnum = ManagerBinding::get().new_ref(desc);
      if (!refnum) return refnum.error();
      log_trace("created refnum %u", refnum.value());
      return LVRef<T>(refnum.take());
    }

    // Take ownership of a refnum the host gave us.
    static LVRef<T> from_raw(LVRefNum refnum) { return LVRef<T>(refnum); }

    // Hand the refnum back to the host without disposing it.
    LVRefNum into_raw(void) {
      LVI_ASSERT(m_locks == 0, "cannot release refnum %u while it is locked", m_refnum);
      LVRefNum out = m_refnum;
      m_refnum = 0;
      m_state = RefState::Disposed;
      return out;
    }

    // Ask the host for the payload. The host may refuse if the refnum was
    // invalidated on its side.
    Result<LockedRef<T>> lock(void) const {
      if (m_state == RefState::Disposed) return Error(ErrorKind::UseAfterDispose);
      auto payload = ManagerBinding::get().lock_ref(m_refnum);
      if (!payload) return payload.error();
      if (payload.value() == nullptr) {
        ManagerBinding::get().unlock_ref(m_refnum);
        return Error(ErrorKind::LockFailed, mZoneErr);
      }
      return LockedRef<T>(*this, static_cast<T *>(payload.value()));
    }

    // Dispose the refnum now. If it is still locked, the host is only told
    // once the last LockedRef has unlocked it; new locks are refused either
    // way.
    void dispose(void) {
      if (m_state == RefState::Disposed) return;
      m_state = RefState::Disposed;
      if (m_locks != 0) {
        log_debug("deferring disposal of refnum %u until %u lock(s) are released", m_refnum,
            m_locks);
        m_dispose_pending = true;
        return;
      }
      ManagerBinding::get().dispose_ref(m_refnum);
      m_refnum = 0;
    }

    LVRefNum raw(void) const { return m_refnum; }
    RefState state(void) const { return m_state; }
    uint32_t lock_count(void) const { return m_locks; }

   private:
    friend class LockedRef<T>;

    explicit LVRef(LVRefNum refnum)
        : m_refnum(refnum) {}

    void acquire(void) const {
      m_locks++;
      m_state = RefState::Locked;
    }

    void release(void) const {
      ManagerBinding::get().unlock_ref(m_refnum);
      m_locks--;
      if (m_locks != 0) return;

      if (m_dispose_pending) {
        m_dispose_pending = false;
        ManagerBinding::get().dispose_ref(m_refnum);
        m_refnum = 0;
      } else if (m_state == RefState::Locked) {
        m_state = RefState::Released;
      }
    }

    mutable LVRefNum m_refnum;
    mutable RefState m_state = RefState::Created;
    mutable uint32_t m_locks = 0;
    mutable bool m_dispose_pending = false;
  };



  // A locked refnum. Gives access to the host-owned payload until it is
  // destroyed, at which point the refnum is unlocked exactly once.
  template <typename T>
  class LockedRef final {
   public:
    LockedRef(LockedRef &&other) noexcept
        : m_owner(other.m_owner)
        , m_payload(other.m_payload) {
      other.m_owner = nullptr;
      other.m_payload = nullptr;
    }

    LockedRef(const LockedRef &) = delete;
    LockedRef &operator=(const LockedRef &) = delete;
    LockedRef &operator=(LockedRef &&) = delete;

    ~LockedRef(void) {
      if (m_owner != nullptr) {
        m_owner->release();
        m_owner = nullptr;
      }
    }

    T *get(void) const { return m_payload; }
    T &operator*(void) const { return *m_payload; }
    T *operator->(void) const { return m_payload; }

   private:
    friend class LVRef<T>;

    LockedRef(const LVRef<T> &owner, T *payload)
        : m_owner(&owner)
        , m_payload(payload) {
      m_owner->acquire();
    }

    const LVRef<T> *m_owner;
    T *m_payload;
  };
}  // namespace lvi
