// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <platform/sifive/platform-serial.hh>

// The memory-mapped instantiation is compiled once, here.  Other register
// types (device models in tests) are instantiated where they are used.
template class SiFive::Uart<uint32_t>;
