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
#include <string>
#include <string_view>
#include <lvi/Handle.hpp>

namespace lvi {

  // A LabVIEW string is a handle to an int32 byte count followed by that many
  // bytes. A null string handle is a valid empty string.
  using LStrHandle = Handle<uint8_t>;

  constexpr size_t lstr_header_size = sizeof(int32_t);

  // Allocate a new string handle holding `text`.
  Result<LStrHandle> lstr_new(std::string_view text);

  // Replace the contents of `handle` with `text`, allocating a block if the
  // handle is null.
  Result<void> lstr_set(LStrHandle &handle, std::string_view text);

  // Copy the bytes out of `handle`. Fails with InvalidHandle if the stored
  // count does not fit inside the block.
  Result<std::string> lstr_get(LStrHandle &handle);
}  // namespace lvi
