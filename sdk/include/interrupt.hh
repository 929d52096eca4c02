// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#ifdef SIFIVE_MACHINE_MODE
#	include <priv/riscv.h>
#endif

/**
 * Run `fn` with machine interrupts masked and return its result.  The
 * previous interrupt-enable state is restored afterwards, so this nests.
 *
 * Only machine-mode builds (`SIFIVE_MACHINE_MODE`) can touch `mstatus`.
 * Anything else, including a hosted build on a RISC-V machine, runs
 * interrupt handlers from the same thread, so only a compiler barrier is
 * needed.
 */
template<typename T>
__always_inline auto with_interrupts_disabled(T &&fn)
{
#ifdef SIFIVE_MACHINE_MODE
	struct Guard
	{
		size_t saved = priv::intr_disable();
		~Guard()
		{
			priv::intr_restore(saved);
		}
	} guard;
#else
	asm volatile("" ::: "memory");
	struct Guard
	{
		~Guard()
		{
			asm volatile("" ::: "memory");
		}
	} guard;
#endif
	return fn();
}
