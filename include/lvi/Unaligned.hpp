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
#include <stdint.h>
#include <string.h>
#include <type_traits>

namespace lvi {

  // Copy a T out of `base + offset`. `base + offset` may have any alignment;
  // the bytes are never accessed through a T reference.
  template <typename T>
  inline T read_unaligned(const void *base, size_t offset) {
    static_assert(std::is_trivially_copyable<T>::value, "unaligned values are copied bytewise");
    T out;
    memcpy(&out, static_cast<const uint8_t *>(base) + offset, sizeof(T));
    return out;
  }

  // Copy the bytes of `value` to `base + offset`, which may have any alignment.
  template <typename T>
  inline void write_unaligned(void *base, size_t offset, const T &value) {
    static_assert(std::is_trivially_copyable<T>::value, "unaligned values are copied bytewise");
    memcpy(static_cast<uint8_t *>(base) + offset, &value, sizeof(T));
  }


  // Describes one field of a host record: a T stored `Offset` bytes into the
  // record. Holds no data. Under the host's 32-bit packing the offset is
  // frequently misaligned for T, so every access is a copy. The same accessor
  // is used under natural packing, where it compiles down to a plain load or
  // store.
  template <typename T, size_t Offset>
  struct UnalignedField {
    using type = T;
    static constexpr size_t offset = Offset;
    static constexpr size_t end = Offset + sizeof(T);

    static T read(const void *base) { return read_unaligned<T>(base, Offset); }
    static void write(void *base, const T &value) { write_unaligned<T>(base, Offset, value); }
  };
}  // namespace lvi
