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

enum { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR, LOG_FATAL };


namespace lvi {
  void log(int level, const char *file, int line, const char *fmt, ...)
      __attribute__((format(printf, 4, 5)));

  // Has no effect if the level was fixed through LVI_LOG_LEVEL.
  void set_log_level(int level);
  int get_log_level(void);

  int printf(const char *format, ...) __attribute__((format(printf, 1, 2)));
};  // namespace lvi



#ifdef LVI_ENABLE_LOGGING
#define log_trace(...) lvi::log(LOG_TRACE, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_debug(...) lvi::log(LOG_DEBUG, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_info(...) lvi::log(LOG_INFO, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_warn(...) lvi::log(LOG_WARN, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_error(...) lvi::log(LOG_ERROR, __FILE_NAME__, __LINE__, __VA_ARGS__)
#define log_fatal(...) lvi::log(LOG_FATAL, __FILE_NAME__, __LINE__, __VA_ARGS__)
#else
#define log_trace(...)
#define log_debug(...)
#define log_info(...)
#define log_warn(...)
#define log_error(...)
#define log_fatal(...)
#endif
