// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <platform/concepts/uart.hh>
#include <stddef.h>
#include <stdint.h>

/**
 * SiFive UART register block, as found on the FE310 family.
 *
 * The peripheral has an eight-entry transmit FIFO and an eight-entry receive
 * FIFO, each with a programmable watermark interrupt.  Documentation is in
 * chapter 18 of the FE310-G002 manual:
 * https://sifive.cdn.prismic.io/sifive/034760b5-ac6a-4b1c-911c-f4148bb2c4a5_fe310-g002-v1p5.pdf
 *
 * All registers are 32 bits wide.  The template parameter allows a model of
 * the device to stand in for the memory-mapped registers.
 */
template<typename RegisterType = uint32_t>
struct SiFiveUartRegisters
{
	/**
	 * Transmit data register.  Writing the low byte enqueues a character;
	 * reads return the full flag in the top bit.
	 */
	RegisterType transmitData;
	/**
	 * Receive data register.  Reading dequeues a character.
	 */
	RegisterType receiveData;
	/**
	 * Transmit control: enable, stop bits, and watermark level.
	 */
	RegisterType transmitControl;
	/**
	 * Receive control: enable and watermark level.
	 */
	RegisterType receiveControl;
	/**
	 * Interrupt enable.
	 */
	RegisterType interruptEnable;
	/**
	 * Interrupt pending.  Read only, the bits clear when the FIFO levels
	 * cross their watermarks.
	 */
	const RegisterType InterruptPending;
	/**
	 * Baud rate divisor.  The baud rate is the bus clock divided by
	 * (divisor + 1).
	 */
	RegisterType divisor;

	/// Transmit data register fields.
	enum : uint32_t
	{
		/// Set if the transmit FIFO cannot accept another character.
		TransmitDataFull = 1u << 31,
		/// The character to transmit.
		TransmitDataMask = 0xff,
	};

	/// Receive data register fields.
	enum : uint32_t
	{
		/// Set if the receive FIFO had no character to return.
		ReceiveDataEmpty = 1u << 31,
		/// The received character.
		ReceiveDataMask = 0xff,
	};

	/// Transmit control register fields.
	enum : uint32_t
	{
		/// Watermark level: the transmit watermark interrupt is pending while
		/// the FIFO holds fewer than this many characters.
		TransmitControlCountMask  = 0b111 << 16,
		TransmitControlCountShift = 16,
		/// Use two stop bits instead of one.
		TransmitControlTwoStopBits = 1 << 1,
		/// Enable the transmitter.
		TransmitControlEnable = 1 << 0,
	};

	/// Receive control register fields.
	enum : uint32_t
	{
		/// Watermark level: the receive watermark interrupt is pending while
		/// the FIFO holds more than this many characters.
		ReceiveControlCountMask  = 0b111 << 16,
		ReceiveControlCountShift = 16,
		/// Enable the receiver.
		ReceiveControlEnable = 1 << 0,
	};

	/// SiFive UART interrupts, used in both the enable and pending registers.
	typedef enum : uint32_t
	{
		/// Raised while the receive FIFO is above its watermark.
		InterruptReceiveWatermark = 1 << 1,
		/// Raised while the transmit FIFO is below its watermark.
		InterruptTransmitWatermark = 1 << 0,
	} SiFiveUartInterrupt;

	/// The divisor field is the low 16 bits of its register.
	static constexpr uint32_t DivisorMask = 0xffff;

	/**
	 * Returns true if the transmit FIFO is full.
	 */
	[[gnu::always_inline]] bool transmit_full() volatile
	{
		uint32_t data = transmitData;
		return (data & TransmitDataFull) != 0;
	}

	/**
	 * Enqueue one character.  The caller must have checked that the FIFO is
	 * not full, otherwise the write is ignored by the hardware.
	 */
	[[gnu::always_inline]] void transmit_write(uint8_t byte) volatile
	{
		transmitData = static_cast<uint32_t>(byte) & TransmitDataMask;
	}

	/**
	 * Write the whole transmit control register.  Fields that are not
	 * arguments (none at present) are written as zero.
	 */
	void transmit_control(bool     enable,
	                      bool     twoStopBits,
	                      uint32_t watermark) volatile
	{
		transmitControl =
		  ((watermark << TransmitControlCountShift) &
		   TransmitControlCountMask) |
		  (twoStopBits ? TransmitControlTwoStopBits : 0) |
		  (enable ? TransmitControlEnable : 0);
	}

	/**
	 * Turn on the transmitter, keeping the watermark and stop-bit fields.
	 */
	void transmit_enable() volatile
	{
		uint32_t control = transmitControl;
		transmitControl  = control | TransmitControlEnable;
	}

	/**
	 * Turn off the transmitter.  This writes the whole register, so the
	 * watermark and stop-bit fields are cleared as well.
	 */
	void transmit_disable() volatile
	{
		transmitControl = 0;
	}

	/**
	 * Turn off the receiver.
	 */
	void receive_disable() volatile
	{
		receiveControl = 0;
	}

	/// Enable the given interrupt.
	void interrupt_enable(SiFiveUartInterrupt interrupt) volatile
	{
		uint32_t enabled = interruptEnable;
		interruptEnable  = enabled | interrupt;
	}

	/// Disable the given interrupt.
	void interrupt_disable(SiFiveUartInterrupt interrupt) volatile
	{
		uint32_t enabled = interruptEnable;
		interruptEnable  = enabled & ~static_cast<uint32_t>(interrupt);
	}

	/**
	 * Returns a snapshot of the pending interrupts.  The bits are live, so
	 * callers should read this once per dispatch.
	 */
	uint32_t interrupts_pending() volatile
	{
		return InterruptPending;
	}

	/**
	 * Set the baud rate divisor.  Only the low 16 bits are stored.
	 */
	void divisor_write(uint32_t value) volatile
	{
		divisor = value & DivisorMask;
	}

	/**
	 * Initialise the UART as a polled console: transmitter on with one stop
	 * bit, receiver and interrupts off.  The divisor is left as the boot
	 * code set it.
	 */
	void init() volatile
	{
		interruptEnable = 0;
		receive_disable();
		transmit_control(true, false, 1);
	}

	/**
	 * Returns true if the transmit FIFO has space.
	 */
	bool can_write() volatile
	{
		return !transmit_full();
	}

	/**
	 * Write one byte, blocking until the byte is written.
	 */
	void blocking_write(uint8_t byte) volatile
	{
		while (!can_write()) {}
		transmit_write(byte);
	}
};

static_assert(offsetof(SiFiveUartRegisters<>, transmitData) == 0x00);
static_assert(offsetof(SiFiveUartRegisters<>, receiveData) == 0x04);
static_assert(offsetof(SiFiveUartRegisters<>, transmitControl) == 0x08);
static_assert(offsetof(SiFiveUartRegisters<>, receiveControl) == 0x0c);
static_assert(offsetof(SiFiveUartRegisters<>, interruptEnable) == 0x10);
static_assert(offsetof(SiFiveUartRegisters<>, InterruptPending) == 0x14);
static_assert(offsetof(SiFiveUartRegisters<>, divisor) == 0x18);
static_assert(sizeof(SiFiveUartRegisters<>) == 0x1c);
static_assert(IsConsoleUart<SiFiveUartRegisters<>>);
