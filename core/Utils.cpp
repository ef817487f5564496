/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <lvi/utils.h>
#include <lvi/Logger.hpp>
#include <stdio.h>
#include <string.h>

void lvi_dump_backtrace(void) {
  FILE *stream = fopen("/proc/self/maps", "r");
  if (stream == NULL) return;

  lvi::printf("Memory Map:\n");
  char line[1024];
  while (fgets(line, sizeof(line), stream) != NULL) {
    fwrite(line, strlen(line), 1, stderr);
  }

  fclose(stream);
}
