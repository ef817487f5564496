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

// Everything a plugin needs to talk to LabVIEW safely.

#include <lvi/host_api.h>
#include <lvi/MgError.hpp>
#include <lvi/Error.hpp>
#include <lvi/Result.hpp>
#include <lvi/Logger.hpp>
#include <lvi/Configuration.hpp>
#include <lvi/ManagerBinding.hpp>
#include <lvi/Handle.hpp>
#include <lvi/LVRef.hpp>
#include <lvi/Unaligned.hpp>
#include <lvi/Cluster.hpp>
#include <lvi/LVBool.hpp>
#include <lvi/LStr.hpp>
#include <lvi/Array.hpp>
#include <lvi/ErrorCluster.hpp>
