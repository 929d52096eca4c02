// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>

/**
 * Concept for a GPIO pin that can be handed to the first I/O function (IOF0)
 * block, which is where the SiFive parts route their peripheral signals.
 */
template<typename T>
concept IsIofPin = requires(T &pin) {
	{ pin.iof0() };
};
