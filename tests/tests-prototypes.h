// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>

__BEGIN_DECLS

int test_debug();
int test_uart_registers();
int test_uart_configure();
int test_uart_transmit();
int test_uart_sync();
int test_uart_receive();

__END_DECLS
