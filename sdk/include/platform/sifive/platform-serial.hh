// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <debug.hh>
#include <errno.h>
#include <interrupt.hh>
#include <platform/concepts/gpio.hh>
#include <platform/sifive/platform-uart.hh>
#include <serial.hh>
#include <span>
#include <stdint.h>
#include <utils.hh>

namespace SiFive
{
	/**
	 * Flag to set when debugging the UART driver.
	 */
	static constexpr bool DebugUart =
#ifdef DEBUG_SIFIVE_UART
	  DEBUG_SIFIVE_UART
#else
	  false
#endif
	  ;

	/**
	 * Interrupt-driven driver for the SiFive UART.
	 *
	 * Transmission is chunked through the transmit FIFO: `transmit_buffer`
	 * fills the FIFO and arms the transmit watermark interrupt, and each
	 * interrupt refills it.  The interrupt that finds the whole buffer
	 * written turns the transmitter off and hands the buffer back to the
	 * transmit client.  Completion is always reported from
	 * `handle_interrupt`, never from `transmit_buffer`, even if the whole
	 * buffer fit in the FIFO.
	 *
	 * Only one transmit may be in flight.  Starting another before the
	 * completion callback is not detected.
	 *
	 * Receive is not implemented, the receive operations fail with
	 * `-ENOSYS`.
	 */
	template<typename RegisterType = uint32_t>
	class Uart : private utils::NoCopyNoMove
	{
		/**
		 * Helper for conditional debug logs and assertions.
		 */
		using Debug = ConditionalDebug<DebugUart, "SiFive UART">;

		/// The register layout for this instantiation.
		using Registers = SiFiveUartRegisters<RegisterType>;

		/// The device.
		volatile Registers *registers;

		/// The bus clock that feeds the baud-rate divisor, in Hz.
		const uint32_t ClockFrequency;

		/// Stop bits used by the interrupt-driven transmit path.
		Serial::StopBits stopBits = Serial::StopBits::One;

		/// The client told about transmit completion.
		utils::OptionalReference<Serial::TransmitClient> transmitClient =
		  nullptr;

		/// The client told about receive completion.
		utils::OptionalReference<Serial::ReceiveClient> receiveClient = nullptr;

		/// The buffer being transmitted.  Occupied iff a transmit is in flight.
		utils::TakeCell<std::span<uint8_t>> transmitBuffer;

		/// Number of bytes of `transmitBuffer` to send.
		size_t transmitLength = 0;

		/// Index of the next byte of `transmitBuffer` to write to the FIFO.
		size_t transmitIndex = 0;

		/**
		 * Write bytes from the cursor until the FIFO is full or the buffer is
		 * exhausted.
		 */
		void fill_fifo(std::span<uint8_t> buffer)
		{
			while ((transmitIndex < transmitLength) &&
			       !registers->transmit_full())
			{
				registers->transmit_write(buffer[transmitIndex]);
				transmitIndex++;
			}
			Debug::Assert(transmitIndex <= transmitLength,
			              "Transmit cursor {} past length {}",
			              transmitIndex,
			              transmitLength);
		}

		public:
		/**
		 * Construct a driver for the UART at `base`, clocked at
		 * `clockFrequency` Hz.  No registers are touched.
		 */
		Uart(volatile Registers *base, uint32_t clockFrequency)
		  : registers(base), ClockFrequency(clockFrequency)
		{
		}

		/**
		 * Route the UART signals to the transmit and receive pins.
		 */
		template<IsIofPin Pin>
		void initialize_gpio_pins(Pin &transmitPin, Pin &receivePin)
		{
			transmitPin.iof0();
			receivePin.iof0();
		}

		/**
		 * Apply line settings.  Returns `-ENOTSUP` for parity or hardware
		 * flow control, which the device does not implement, and `-EINVAL`
		 * for a baud rate of zero or above the clock frequency.  No registers
		 * are written on failure.
		 *
		 * The device frames only eight-bit characters, `width` is ignored.
		 * The new stop-bit setting takes effect at the next transmit.
		 */
		int configure(const Serial::Parameters &parameters)
		{
			if ((parameters.parity != Serial::Parity::None) ||
			    parameters.hardwareFlowControl)
			{
				Debug::log("Unsupported line settings: parity {}, flow "
				           "control {}",
				           parameters.parity,
				           parameters.hardwareFlowControl);
				return -ENOTSUP;
			}
			if ((parameters.baudRate == 0) ||
			    (parameters.baudRate > ClockFrequency))
			{
				Debug::log("Baud rate {} out of range for {} Hz clock",
				           parameters.baudRate,
				           ClockFrequency);
				return -EINVAL;
			}
			uint32_t divisor = ClockFrequency / parameters.baudRate - 1;
			if (divisor > Registers::DivisorMask)
			{
				Debug::log("Divisor {} truncated to 16 bits", divisor);
			}
			registers->divisor_write(divisor);
			stopBits = parameters.stopBits;
			return 0;
		}

		/**
		 * Set the client that is told when a transmit completes.
		 */
		void set_transmit_client(Serial::TransmitClient &client)
		{
			transmitClient = client;
		}

		/**
		 * Start sending the first `length` bytes of `buffer`.  On success the
		 * driver owns `buffer` until it is returned via
		 * `TransmitClient::transmitted_buffer`.  Returns `-EINVAL` and the
		 * buffer if `length` is zero or larger than the buffer.
		 */
		Serial::BufferResult transmit_buffer(std::span<uint8_t> buffer,
		                                     size_t             length)
		{
			if ((length == 0) || (length > buffer.size()))
			{
				Debug::log("Rejecting transmit of {} bytes from a {}-byte "
				           "buffer",
				           length,
				           buffer.size());
				return {-EINVAL, buffer};
			}
			Debug::Assert(transmitBuffer.is_none(),
			              "Transmit started while one is in flight");
			size_t queued = with_interrupts_disabled([&]() {
				registers->interrupt_enable(
				  Registers::InterruptTransmitWatermark);
				transmitIndex  = 0;
				transmitLength = length;
				fill_fifo(buffer);
				transmitBuffer.replace(buffer);
				registers->transmit_control(
				  true, stopBits == Serial::StopBits::Two, 1);
				return transmitIndex;
			});
			Debug::log("Transmitting {} bytes, {} queued", length, queued);
			return {0, {}};
		}

		/**
		 * Transfers cannot be cancelled.
		 */
		int transmit_abort()
		{
			return -ENOSYS;
		}

		/**
		 * Single-word transmission is not implemented.
		 */
		int transmit_word(uint32_t)
		{
			return -ENOSYS;
		}

		/**
		 * Set the client that would be told about received data.
		 */
		void set_receive_client(Serial::ReceiveClient &client)
		{
			receiveClient = client;
		}

		/**
		 * Receive is not implemented.  Always returns `-ENOSYS` and the
		 * buffer.
		 */
		Serial::BufferResult receive_buffer(std::span<uint8_t> buffer, size_t)
		{
			return {-ENOSYS, buffer};
		}

		/**
		 * Receive is not implemented.
		 */
		int receive_abort()
		{
			return -ENOSYS;
		}

		/**
		 * Receive is not implemented.
		 */
		int receive_word()
		{
			return -ENOSYS;
		}

		/**
		 * Write `bytes` by polling, without interrupts.  Returns once the last
		 * byte is in the FIFO.  Always uses one stop bit.
		 *
		 * Must not be used while an interrupt-driven transmit is in flight.
		 */
		void transmit_sync(std::span<const uint8_t> bytes)
		{
			registers->transmit_control(true, false, 1);
			for (uint8_t byte : bytes)
			{
				while (registers->transmit_full()) {}
				registers->transmit_write(byte);
			}
		}

		/**
		 * Service the UART interrupt.  Called by the platform's interrupt
		 * dispatch.  Refills the FIFO, or completes the transmit and calls
		 * the transmit client.  The receive watermark is ignored.
		 */
		void handle_interrupt()
		{
			uint32_t pending = registers->interrupts_pending();
			if ((pending & Registers::InterruptTransmitWatermark) == 0)
			{
				return;
			}
			if (transmitIndex == transmitLength)
			{
				auto   buffer = transmitBuffer.take();
				size_t length = transmitLength;
				// The debug console may be this device, so log while the
				// transmitter is still on.
				if (buffer)
				{
					Debug::log("Transmit of {} bytes complete", length);
				}
				registers->transmit_disable();
				registers->interrupt_disable(
				  Registers::InterruptTransmitWatermark);
				// The client may start another transmit from the callback,
				// so nothing may touch driver state after this.
				if (buffer)
				{
					transmitClient.and_then([&](auto &client) {
						client.transmitted_buffer(*buffer, length, 0);
					});
				}
				return;
			}
			transmitBuffer.map(
			  [&](std::span<uint8_t> &buffer) { fill_fifo(buffer); });
		}
	};

	extern template class Uart<uint32_t>;

	static_assert(Serial::IsConfigurable<Uart<>>);
	static_assert(Serial::IsTransmitter<Uart<>>);
	static_assert(Serial::IsReceiver<Uart<>>);

} // namespace SiFive
