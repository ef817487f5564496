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
#include <new>
#include <utility>
#include <lvi/Error.hpp>
#include <lvi/utils.h>

namespace lvi {

  // Either a value of type T or an lvi::Error. Every fallible operation in
  // the library returns one of these; nothing reports failure through a
  // default value.
  template <typename T>
  class [[nodiscard]] Result {
   public:
    Result(const T &value)
        : m_ok(true) {
      new (&m_storage) T(value);
    }

    Result(T &&value)
        : m_ok(true) {
      new (&m_storage) T(std::move(value));
    }

    Result(Error error)
        : m_error(error)
        , m_ok(false) {}

    Result(Result &&other)
        : m_error(other.m_error)
        , m_ok(other.m_ok) {
      if (m_ok) new (&m_storage) T(std::move(other.unwrap()));
    }

    Result(const Result &other)
        : m_error(other.m_error)
        , m_ok(other.m_ok) {
      if (m_ok) new (&m_storage) T(other.unwrap());
    }

    Result &operator=(Result &&other) {
      if (this != &other) {
        clear();
        m_error = other.m_error;
        m_ok = other.m_ok;
        if (m_ok) new (&m_storage) T(std::move(other.unwrap()));
      }
      return *this;
    }

    Result &operator=(const Result &other) = delete;

    ~Result(void) { clear(); }

    bool ok(void) const { return m_ok; }
    explicit operator bool(void) const { return m_ok; }

    T &value(void) {
      LVI_ASSERT(m_ok, "value() on a failed result: %s", m_error.to_string().c_str());
      return unwrap();
    }

    const T &value(void) const {
      LVI_ASSERT(m_ok, "value() on a failed result: %s", m_error.to_string().c_str());
      return unwrap();
    }

    // Move the value out. The result still reports ok() but holds a
    // moved-from value afterwards.
    T take(void) { return std::move(value()); }

    const Error &error(void) const {
      LVI_ASSERT(!m_ok, "error() on a successful result");
      return m_error;
    }

    T value_or(T fallback) {
      if (m_ok) return take();
      return fallback;
    }

   private:
    T &unwrap(void) { return *reinterpret_cast<T *>(&m_storage); }
    const T &unwrap(void) const { return *reinterpret_cast<const T *>(&m_storage); }

    void clear(void) {
      if (m_ok) {
        unwrap().~T();
        m_ok = false;
      }
    }

    alignas(T) uint8_t m_storage[sizeof(T)];
    Error m_error{ErrorKind::InvalidHandle};
    bool m_ok;
  };


  template <>
  class [[nodiscard]] Result<void> {
   public:
    Result(void)
        : m_ok(true) {}

    Result(Error error)
        : m_error(error)
        , m_ok(false) {}

    bool ok(void) const { return m_ok; }
    explicit operator bool(void) const { return m_ok; }

    const Error &error(void) const {
      LVI_ASSERT(!m_ok, "error() on a successful result");
      return m_error;
    }

   private:
    Error m_error{ErrorKind::InvalidHandle};
    bool m_ok;
  };


  // Return early from the enclosing function if `expr` failed.
#define LVI_TRY(expr)                                       \
  do {                                                      \
    auto &&lvi_try_result = (expr);                         \
    if (!lvi_try_result.ok()) return lvi_try_result.error(); \
  } while (0)

  // Declare `decl` from the value of a successful `expr`, or return its error.
#define LVI_TRY_ASSIGN(decl, expr)                                     \
  auto LVI_CONCAT(lvi_try_, __LINE__) = (expr);                      \
  if (!LVI_CONCAT(lvi_try_, __LINE__).ok())                          \
    return LVI_CONCAT(lvi_try_, __LINE__).error();                   \
  decl = LVI_CONCAT(lvi_try_, __LINE__).take()

}  // namespace lvi
