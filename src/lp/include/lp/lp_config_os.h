// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Auto detect OS and certain features.
 * @ingroup lp_iface
 */

#pragma once


/*
 *
 * Auto detect OS.
 *
 */

#if defined(__linux__)
#define LP_OS_LINUX
#define LP_OS_UNIX
#define LP_OS_WAS_AUTODETECTED
#endif

#if defined(__APPLE__) && !defined(LP_OS_WAS_AUTODETECTED)
#define LP_OS_MACOS
#define LP_OS_UNIX
#define LP_OS_WAS_AUTODETECTED
#endif


#ifndef LP_OS_WAS_AUTODETECTED
#error "OS type not found during compile"
#endif
#undef LP_OS_WAS_AUTODETECTED
