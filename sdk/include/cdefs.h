// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

// Pull in the C library's own definitions first so that the guarded versions
// below do not collide with them on hosted builds.
#include <stdint.h>

#if defined(__cplusplus)
#	ifndef __BEGIN_DECLS
#		define __BEGIN_DECLS                                                  \
			extern "C"                                                         \
			{
#		define __END_DECLS }
#	endif
#else
#	ifndef __BEGIN_DECLS
#		define __BEGIN_DECLS
#		define __END_DECLS
#	endif
#endif

#ifndef __always_inline
#	define __always_inline __attribute__((always_inline))
#endif

#define __predict_false(exp) __builtin_expect((exp), 0)
