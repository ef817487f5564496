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

namespace lvi {

  // LabVIEW's one byte boolean, as it appears in clusters and arrays.
  class LVBool {
   public:
    constexpr LVBool(void)
        : m_value(0) {}
    constexpr LVBool(bool value)
        : m_value(value ? 1 : 0) {}

    static constexpr LVBool from_raw(uint8_t raw) { return LVBool(raw, 0); }

    // Any nonzero byte is true.
    constexpr explicit operator bool(void) const { return m_value != 0; }
    constexpr uint8_t raw(void) const { return m_value; }

    constexpr bool operator==(LVBool other) const { return m_value == other.m_value; }
    constexpr bool operator!=(LVBool other) const { return m_value != other.m_value; }

   private:
    constexpr LVBool(uint8_t raw, int)
        : m_value(raw) {}

    uint8_t m_value;
  };

  static_assert(sizeof(LVBool) == 1, "LVBool must match the host's one byte boolean");

  constexpr LVBool LV_FALSE = LVBool(false);
  constexpr LVBool LV_TRUE = LVBool(true);
}  // namespace lvi
