/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

// Libraries are static unless KB_SHARED_LIBS is defined by the build.
#if defined(_WIN32) && defined(KB_SHARED_LIBS)
#ifdef KB_CORE_EXPORTS
#define KB_CORE_API __declspec(dllexport)
#else
#define KB_CORE_API __declspec(dllimport)
#endif
#ifdef KB_RENDERING_EXPORTS
#define KB_RENDERING_API __declspec(dllexport)
#else
#define KB_RENDERING_API __declspec(dllimport)
#endif
#ifdef KB_IO_EXPORTS
#define KB_IO_API __declspec(dllexport)
#else
#define KB_IO_API __declspec(dllimport)
#endif
#elif defined(_WIN32)
#define KB_CORE_API
#define KB_RENDERING_API
#define KB_IO_API
#else
#define KB_CORE_API      __attribute__((visibility("default")))
#define KB_RENDERING_API __attribute__((visibility("default")))
#define KB_IO_API        __attribute__((visibility("default")))
#endif
