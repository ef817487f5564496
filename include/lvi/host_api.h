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

// The raw values that cross the boundary between LabVIEW and a plugin. Nothing
// in here owns anything: the safe wrappers in lvi/ take these apart on entry
// and put them back together before control returns to the host.

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Status code returned by every fallible memory manager call. Zero is success.
typedef int32_t MgErr;

// A handle is a pointer to the manager's master pointer. The master pointer
// may be changed by the manager whenever the block is resized.
typedef uint8_t **UHandle;

// An opaque reference token issued by the host.
typedef uint32_t LVRefNum;

// What the host needs to know to create the payload behind a new refnum. The
// host copies `payload_size` bytes from `initial_payload` (if non-null) into
// storage it owns, and calls `cleanup` on that storage when the refnum is
// disposed.
typedef struct {
  size_t payload_size;
  const void *initial_payload;
  void (*cleanup)(void *payload);
} LVRefDescriptor;

// The error cluster as LabVIEW passes it with "handles by value". Only ever
// accessed through lvi::ErrorCluster.
typedef struct LVErrorCluster LVErrorCluster;
typedef LVErrorCluster *ErrorClusterPtr;


#ifdef LVI_LINK_HOST
// Exported by the LabVIEW runtime. Only referenced when the plugin is linked
// against the host's export library.
extern UHandle DSNewHandle(uint32_t size);
extern MgErr DSSetHandleSize(UHandle h, uint32_t size);
extern int32_t DSGetHandleSize(UHandle h);
extern MgErr DSDisposeHandle(UHandle h);
extern void MoveBlock(const void *src, void *dst, size_t size);
extern MgErr NumericArrayResize(int32_t type_code, int32_t num_dims, UHandle *hp, size_t new_size);
#endif

#ifdef __cplusplus
}
#endif
