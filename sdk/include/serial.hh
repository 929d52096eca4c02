// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <span>
#include <stddef.h>
#include <stdint.h>

/**
 * Interfaces between serial-port drivers and the rest of the system.
 *
 * Transfers are asynchronous.  A client lends a buffer to the driver with
 * `transmit_buffer` or `receive_buffer`; if the call succeeds, the driver owns
 * the buffer until it hands it back through the matching client callback.  If
 * the call fails, the buffer is handed back immediately in the result.
 *
 * Errors are reported as negative `errno` values, zero is success.
 */
namespace Serial
{
	/// Number of stop bits per character.
	enum class StopBits
	{
		One,
		Two,
	};

	/// Parity mode.
	enum class Parity
	{
		None,
		Odd,
		Even,
	};

	/// Character width, in data bits.
	enum class Width
	{
		Six,
		Seven,
		Eight,
	};

	/**
	 * Line configuration requested by a client.
	 */
	struct Parameters
	{
		/// Line rate in bits per second.
		uint32_t baudRate;
		/// Data bits per character.
		Width width = Width::Eight;
		/// Parity mode.
		Parity parity = Parity::None;
		/// Stop bits.
		StopBits stopBits = StopBits::One;
		/// Use RTS / CTS flow control.
		bool hardwareFlowControl = false;
	};

	/// Line errors that can accompany received data.
	enum class Error
	{
		None,
		ParityError,
		FramingError,
		OverrunError,
		RepeatCallError,
		ResetError,
		BreakError,
		Aborted,
	};

	/**
	 * Result of handing a buffer to a driver.  If `status` is zero the driver
	 * now owns the buffer and `buffer` is empty.  Otherwise `buffer` is the
	 * caller's buffer, returned unchanged.
	 */
	struct [[nodiscard]] BufferResult
	{
		/// Zero or a negative errno value.
		int status;
		/// The caller's buffer on failure, empty on success.
		std::span<uint8_t> buffer;
	};

	/**
	 * Receiver of transmit-completion notifications.
	 */
	class TransmitClient
	{
		public:
		/**
		 * Called once per successful `transmit_buffer`, returning ownership of
		 * `buffer`.  `length` is the number of bytes the caller asked to send.
		 * The driver has finished with its state by the time this is called,
		 * so a new transmit may be started from here.
		 */
		virtual void transmitted_buffer(std::span<uint8_t> buffer,
		                                size_t             length,
		                                int                status) = 0;

		/**
		 * Called when a single-word transmit completes.
		 */
		virtual void transmitted_word(int) {}

		protected:
		~TransmitClient() = default;
	};

	/**
	 * Receiver of receive-completion notifications.
	 */
	class ReceiveClient
	{
		public:
		/**
		 * Called once per successful `receive_buffer`, returning ownership of
		 * `buffer` with `length` bytes filled.
		 */
		virtual void received_buffer(std::span<uint8_t> buffer,
		                             size_t             length,
		                             int                status,
		                             Error              error) = 0;

		/**
		 * Called when a single-word receive completes.
		 */
		virtual void received_word(uint32_t, int, Error) {}

		protected:
		~ReceiveClient() = default;
	};

	/**
	 * Concept for a driver whose line settings can be changed.
	 */
	template<typename T>
	concept IsConfigurable = requires(T &driver, const Parameters &parameters) {
		{ driver.configure(parameters) } -> std::same_as<int>;
	};

	/**
	 * Concept for a driver that can transmit.
	 */
	template<typename T>
	concept IsTransmitter = requires(T                 &driver,
	                                 TransmitClient    &client,
	                                 std::span<uint8_t> buffer,
	                                 size_t             length,
	                                 uint32_t           word) {
		{ driver.set_transmit_client(client) };
		{
			driver.transmit_buffer(buffer, length)
		} -> std::same_as<BufferResult>;
		{ driver.transmit_word(word) } -> std::same_as<int>;
		{ driver.transmit_abort() } -> std::same_as<int>;
	};

	/**
	 * Concept for a driver that can receive.
	 */
	template<typename T>
	concept IsReceiver = requires(T                 &driver,
	                              ReceiveClient     &client,
	                              std::span<uint8_t> buffer,
	                              size_t             length) {
		{ driver.set_receive_client(client) };
		{
			driver.receive_buffer(buffer, length)
		} -> std::same_as<BufferResult>;
		{ driver.receive_word() } -> std::same_as<int>;
		{ driver.receive_abort() } -> std::same_as<int>;
	};

} // namespace Serial
