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

#include <stdio.h>
#include <stdlib.h>

#ifdef LVI_SANITY_CHECK
#define LVI_SANITY(c, msg, ...)                                                                 \
  do {                                                                                          \
    if (!(c)) { /* if the check is not true... */                                               \
      fprintf(stderr, "\x1b[31m-------------[ LVI Sanity Check Failed ]-------------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                                      \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                             \
      fprintf(stderr, msg "\n", ##__VA_ARGS__);                                                 \
      lvi_dump_backtrace();                                                                     \
      fprintf(stderr, "\x1b[31m                      Bailing!\x1b[0m\n");                       \
      exit(EXIT_FAILURE);                                                                       \
    }                                                                                           \
  } while (0)
#else
#define LVI_SANITY(c, msg, ...) /* do nothing if it's disabled */
#endif

#define LVI_ASSERT(c, msg, ...)                                                            \
  do {                                                                                     \
    if (!(c)) { /* if the check is not true... */                                          \
      fprintf(stderr, "\x1b[31m-------------[ LVI Assert Failed ]-------------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                                 \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                        \
      fprintf(stderr, "Reason: \x1b[33m" msg "\x1b[0m\n", ##__VA_ARGS__);                  \
      lvi_dump_backtrace();                                                                \
      fprintf(stderr, "\x1b[31mExiting.\x1b[0m\n");                                        \
      abort();                                                                             \
    }                                                                                      \
  } while (0)


#define LVI_EXPORT __attribute__((visibility("default")))

#define LVI_CONCAT_IMPL(a, b) a##b
#define LVI_CONCAT(a, b) LVI_CONCAT_IMPL(a, b)


// Dump the process memory map to stderr. Used by the assertion macros.
extern void lvi_dump_backtrace(void);
