/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <lvi/LStr.hpp>
#include <lvi/Unaligned.hpp>
#include <stdint.h>

namespace lvi {

  Result<LStrHandle> lstr_new(std::string_view text) {
    LVI_TRY_ASSIGN(LStrHandle handle, LStrHandle::allocate(lstr_header_size + text.size()));
    LVI_TRY(lstr_set(handle, text));
    return handle;
  }


  Result<void> lstr_set(LStrHandle &handle, std::string_view text) {
    if (text.size() > INT32_MAX - lstr_header_size) return Error(ErrorKind::ResizeFailed, mgArgErr);
    size_t needed = lstr_header_size + text.size();

    if (handle.is_null()) {
      LVI_TRY_ASSIGN(handle, LStrHandle::allocate(needed));
    } else if (handle.len() != needed) {
      LVI_TRY(handle.resize(needed));
    }

    auto locked = handle.lock();
    if (!locked) return locked.error();
    uint8_t *bytes = locked.value().bytes();

    write_unaligned<int32_t>(bytes, 0, (int32_t)text.size());
    ManagerBinding::get().move_block(text.data(), bytes + lstr_header_size, text.size());
    return {};
  }


  Result<std::string> lstr_get(LStrHandle &handle) {
    if (handle.is_null()) return std::string();

    auto locked = handle.lock();
    if (!locked) return locked.error();
    const auto &view = locked.value();
    if (view.size() < lstr_header_size) return Error(ErrorKind::InvalidHandle, mZoneErr);

    int32_t count = read_unaligned<int32_t>(view.bytes(), 0);
    if (count < 0 || (size_t)count > view.size() - lstr_header_size) {
      return Error(ErrorKind::InvalidHandle, mZoneErr);
    }
    return std::string(reinterpret_cast<const char *>(view.bytes()) + lstr_header_size, count);
  }
}  // namespace lvi
