/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

// A small plugin showing how entry points called from a LabVIEW Call Library
// Function node use the wrappers: raw values in, wrap immediately, work only
// through the wrappers, unwrap before returning.

#include <lvi.hpp>
#include <stdint.h>

using namespace lvi;


namespace {
  // The payload behind a counter refnum.
  struct Counter {
    int64_t value;
    int64_t step;
  };


  class TextError final : public ClusterReportable {
   public:
    explicit TextError(const char *text)
        : m_text(text) {}

    std::string source(void) const override { return "LVI"; }
    std::string description(void) const override { return m_text; }

   private:
    const char *m_text;
  };


  Result<void> always_fails(intptr_t, intptr_t) { return Error(ErrorKind::InvalidHandle); }
}  // namespace



// Write a fixed error into the cluster LabVIEW passed.
extern "C" LVI_EXPORT MgErr set_error_cluster(ErrorClusterPtr cluster) {
  TextError error("This is a test");
  auto written = error.write_error(cluster);
  if (!written) return written.error().code();
  return error.code();
}


// Skip the work if an error came in, otherwise report the work's failure
// through the cluster.
extern "C" LVI_EXPORT MgErr auto_error_handling(
    ErrorClusterPtr cluster, intptr_t param1, intptr_t param2) {
  return with_error_cluster(cluster, always_fails, param1, param2);
}


// Resize the u8 array handle at `*hp` to `count` bytes and fill it with
// `value`. LabVIEW passes the handle by pointer so we may replace it.
extern "C" LVI_EXPORT MgErr fill_u8_handle(UHandle *hp, int32_t count, uint8_t value) {
  if (hp == nullptr || count < 0) return mgArgErr;

  Handle<uint8_t> handle = Handle<uint8_t>::from_raw(*hp);
  auto filled = [&]() -> Result<void> {
    if (handle.is_null()) {
      LVI_TRY_ASSIGN(handle, Handle<uint8_t>::allocate(count));
    } else {
      LVI_TRY(handle.resize(count));
    }
    LVI_TRY_ASSIGN(auto locked, handle.lock());
    for (auto &byte : locked)
      byte = value;
    return {};
  }();

  *hp = handle.into_raw();
  return filled ? (MgErr)mgNoErr : filled.error().code();
}


// The length of a LabVIEW string, or -1 if the handle is malformed.
extern "C" LVI_EXPORT int32_t string_length(UHandle str) {
  LStrHandle handle = LStrHandle::from_raw(str);
  auto text = lstr_get(handle);
  handle.into_raw();
  if (!text) return -1;
  return (int32_t)text.value().size();
}


extern "C" LVI_EXPORT MgErr counter_create(int64_t start, int64_t step, LVRefNum *out) {
  if (out == nullptr) return mgArgErr;

  auto ref = LVRef<Counter>::create(Counter{start, step});
  if (!ref) return ref.error().code();
  *out = ref.value().into_raw();
  return mgNoErr;
}


// Advance the counter and return its new value through `value`. Fails with
// mgArgErr, leaving the counter alone, if the step would overflow it.
extern "C" LVI_EXPORT MgErr counter_increment(LVRefNum refnum, int64_t *value) {
  if (value == nullptr) return mgArgErr;

  LVRef<Counter> ref = LVRef<Counter>::from_raw(refnum);
  MgErr status = mgNoErr;
  {
    auto locked = ref.lock();
    if (locked) {
      Counter &counter = *locked.value();
      int64_t next;
      if (__builtin_add_overflow(counter.value, counter.step, &next)) {
        status = mgArgErr;
      } else {
        counter.value = next;
        *value = next;
      }
    } else {
      status = locked.error().code();
    }
  }
  // The refnum still belongs to the diagram.
  ref.into_raw();
  return status;
}


extern "C" LVI_EXPORT MgErr counter_dispose(LVRefNum refnum) {
  LVRef<Counter> ref = LVRef<Counter>::from_raw(refnum);
  ref.dispose();
  return mgNoErr;
}
