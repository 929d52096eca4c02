// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#ifndef _PRIV_RISCV_H_
#define _PRIV_RISCV_H_

#include <stddef.h>

namespace priv
{
	constexpr size_t MSTATUS_UIE = (1 << 0);
	constexpr size_t MSTATUS_SIE = (1 << 1);
	constexpr size_t MSTATUS_HIE = (1 << 2);
	constexpr size_t MSTATUS_MIE = (1 << 3);
	constexpr size_t MSTATUS_AIE =
	  (MSTATUS_UIE | MSTATUS_SIE | MSTATUS_HIE | MSTATUS_MIE);

	/**
	 * Clear the global interrupt-enable bits and return the ones that were
	 * set, for `intr_restore`.
	 */
	static inline size_t intr_disable(void)
	{
		size_t ret;

		__asm volatile("csrrci %0, mstatus, %1"
		               : "=&r"(ret)
		               : "i"(MSTATUS_AIE)
		               : "memory");

		return (ret & (MSTATUS_AIE));
	}

	static inline void intr_restore(size_t s)
	{
		__asm volatile("csrs mstatus, %0" ::"r"(s) : "memory");
	}

} // namespace priv

#endif // _PRIV_RISCV_H_
