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
#include <array>
#include <vector>
#include <lvi/Cluster.hpp>
#include <lvi/Handle.hpp>
#include <lvi/Unaligned.hpp>

namespace lvi {

  // The code the memory manager uses to size numeric array elements.
  template <typename T>
  struct TypeCode;

  template <> struct TypeCode<int8_t> { static constexpr int32_t value = 0x01; };
  template <> struct TypeCode<int16_t> { static constexpr int32_t value = 0x02; };
  template <> struct TypeCode<int32_t> { static constexpr int32_t value = 0x03; };
  template <> struct TypeCode<int64_t> { static constexpr int32_t value = 0x04; };
  template <> struct TypeCode<uint8_t> { static constexpr int32_t value = 0x05; };
  template <> struct TypeCode<uint16_t> { static constexpr int32_t value = 0x06; };
  template <> struct TypeCode<uint32_t> { static constexpr int32_t value = 0x07; };
  template <> struct TypeCode<uint64_t> { static constexpr int32_t value = 0x08; };
  template <> struct TypeCode<float> { static constexpr int32_t value = 0x09; };
  template <> struct TypeCode<double> { static constexpr int32_t value = 0x0A; };


  template <typename T, size_t D>
  class LockedArray;


  // A LabVIEW numeric array: a handle to D int32 dimension sizes followed by
  // the elements in row-major order. Where the elements start depends on the
  // packing rule, so elements are only ever copied in and out.
  template <typename T, size_t D = 1>
  class ArrayHandle final {
    static_assert(D > 0, "arrays have at least one dimension");

   public:
    using Dims = std::array<int32_t, D>;

    static constexpr size_t dims_size = sizeof(int32_t) * D;
    static constexpr size_t data_offset = host_packing == Packing::Natural
                                              ? detail::align_to(dims_size, alignof(T))
                                              : dims_size;

    ArrayHandle(void) = default;

    // The number of elements `dims` describes. Fails if the elements, with
    // the dimension header, would not fit in a size_t.
    static bool element_count(const Dims &dims, size_t &count) {
      count = 1;
      for (auto d : dims) {
        if (__builtin_mul_overflow(count, d > 0 ? (size_t)d : 0, &count)) return false;
      }
      size_t bytes;
      if (__builtin_mul_overflow(count, sizeof(T), &bytes)) return false;
      return !__builtin_add_overflow(bytes, data_offset, &bytes);
    }

    static Result<ArrayHandle> allocate(const Dims &dims) {
      size_t count;
      if (!element_count(dims, count)) return Error(ErrorKind::AllocationFailed, mgArgErr);
      auto handle = Handle<uint8_t>::allocate(data_offset + count * sizeof(T));
      if (!handle) return handle.error();
      ArrayHandle out(handle.take());
      LVI_TRY(out.write_dims(dims));
      return std::move(out);
    }

    static ArrayHandle from_raw(UHandle raw) { return ArrayHandle(Handle<uint8_t>::from_raw(raw)); }
    UHandle into_raw(void) { return m_handle.into_raw(); }
    UHandle raw(void) const { return m_handle.raw(); }
    bool is_null(void) const { return m_handle.is_null(); }

    // A null array handle is an empty array.
    Result<Dims> dims(void) {
      Dims out{};
      if (m_handle.is_null()) return out;
      auto locked = m_handle.lock();
      if (!locked) return locked.error();
      if (locked.value().size() < dims_size) return Error(ErrorKind::InvalidHandle, mZoneErr);
      for (size_t i = 0; i < D; i++)
        out[i] = read_unaligned<int32_t>(locked.value().bytes(), i * sizeof(int32_t));
      return out;
    }

    Result<size_t> len(void) {
      LVI_TRY_ASSIGN(Dims current, dims());
      size_t count;
      if (!element_count(current, count)) return Error(ErrorKind::InvalidHandle, mZoneErr);
      return count;
    }

    // Resize through the manager's numeric array support. Nothing happens if
    // the dimensions are unchanged, and the stored dimensions are only
    // updated once the manager has succeeded.
    Result<void> resize(const Dims &new_dims) {
      size_t count;
      if (!element_count(new_dims, count)) return Error(ErrorKind::ResizeFailed, mgArgErr);
      if (!m_handle.is_null()) {
        LVI_TRY_ASSIGN(Dims current, dims());
        if (current == new_dims) return {};
      }

      UHandle raw = m_handle.into_raw();
      auto resized = ManagerBinding::get().numeric_array_resize(
          TypeCode<T>::value, (int32_t)D, &raw, count);
      // The manager may have replaced the handle, even on failure.
      m_handle = Handle<uint8_t>::from_raw(raw);
      if (!resized) return resized;
      return write_dims(new_dims);
    }

    Result<LockedArray<T, D>> lock(void) {
      auto locked = m_handle.lock();
      if (!locked) return locked.error();
      if (locked.value().size() < dims_size) return Error(ErrorKind::InvalidHandle, mZoneErr);
      return LockedArray<T, D>(locked.take());
    }

    // Copy every element out.
    Result<std::vector<T>> to_vector(void) {
      auto locked = lock();
      if (!locked) return locked.error();
      std::vector<T> out(locked.value().size());
      for (size_t i = 0; i < out.size(); i++)
        out[i] = locked.value().get(i);
      return out;
    }

   private:
    explicit ArrayHandle(Handle<uint8_t> handle)
        : m_handle(std::move(handle)) {}

    Result<void> write_dims(const Dims &dims) {
      auto locked = m_handle.lock();
      if (!locked) return locked.error();
      if (locked.value().size() < dims_size) return Error(ErrorKind::InvalidHandle, mZoneErr);
      for (size_t i = 0; i < D; i++)
        write_unaligned<int32_t>(locked.value().bytes(), i * sizeof(int32_t), dims[i]);
      return {};
    }

    Handle<uint8_t> m_handle;
  };



  // Element access to a locked array. Elements may be misaligned, so they
  // are read and written by copy. Only built by ArrayHandle::lock(), which
  // has checked that the block holds the dimension header.
  template <typename T, size_t D>
  class LockedArray final {
   public:
    using Array = ArrayHandle<T, D>;

    size_t size(void) const { return m_count; }

    T get(size_t i) const {
      LVI_SANITY(i < m_count, "index %zu out of range for an array of %zu", i, m_count);
      return read_unaligned<T>(m_bytes.bytes(), Array::data_offset + i * sizeof(T));
    }

    void set(size_t i, const T &value) {
      LVI_SANITY(i < m_count, "index %zu out of range for an array of %zu", i, m_count);
      write_unaligned<T>(m_bytes.bytes(), Array::data_offset + i * sizeof(T), value);
    }

   private:
    friend class ArrayHandle<T, D>;

    explicit LockedArray(LockedHandle<uint8_t> &&bytes)
        : m_bytes(std::move(bytes)) {
      size_t stored = 1;
      for (size_t i = 0; i < D; i++) {
        int32_t d = read_unaligned<int32_t>(m_bytes.bytes(), i * sizeof(int32_t));
        if (__builtin_mul_overflow(stored, d > 0 ? (size_t)d : 0, &stored)) stored = SIZE_MAX;
      }
      // Never trust the dimensions further than the block reaches.
      size_t room = m_bytes.size() > Array::data_offset
                        ? (m_bytes.size() - Array::data_offset) / sizeof(T)
                        : 0;
      m_count = stored < room ? stored : room;
    }

    LockedHandle<uint8_t> m_bytes;
    size_t m_count;
  };
}  // namespace lvi
