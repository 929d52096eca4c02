// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <stdint.h>

/**
 * Concept for checking that a UART register block can be used as a polled,
 * write-only console (for example, as the sink for debug output).
 */
template<typename T>
concept IsConsoleUart = requires(volatile T *v, uint8_t byte) {
	{ v->init() };
	{ v->can_write() } -> std::same_as<bool>;
	{ v->blocking_write(byte) };
};
