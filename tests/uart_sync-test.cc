// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#define TEST_NAME "UART sync"
#include "tests.hh"
#include "uart-model.hh"
#include <platform/sifive/platform-serial.hh>
#include <string_view>

using Uart   = SiFive::Uart<ModelRegister>;
using Name   = ModelRegister::Name;
using Layout = SiFiveUartRegisters<uint32_t>;

namespace
{
	/**
	 * Every write to the transmit data register must follow a read of it
	 * that reported the FIFO not full.
	 */
	void check_writes_follow_not_full(UartModel &model)
	{
		bool sawNotFull = false;
		for (const auto &access : model.accesses)
		{
			if (access.name != Name::TransmitData)
			{
				continue;
			}
			if (access.isWrite)
			{
				TEST(sawNotFull, "Data written without seeing the FIFO not full");
				sawNotFull = false;
			}
			else
			{
				sawNotFull = (access.value & Layout::TransmitDataFull) == 0;
			}
		}
	}

	void test_slow_line()
	{
		// The FIFO fills after four bytes and then frees one entry each time
		// the driver polls and finds it full.
		UartModel model{4};
		model.drainOnFullPoll = 1;
		Uart uart{&model.registers, 16'000'000};

		std::string_view message = "Hello from the polled path\n";
		std::span<const uint8_t> bytes{
		  reinterpret_cast<const uint8_t *>(message.data()), message.size()};
		uart.transmit_sync(bytes);
		model.drain();

		TEST_EQUAL(model.write_count(Name::TransmitData),
		           message.size(),
		           "Number of data writes");
		TEST_EQUAL(model.droppedWrites, size_t(0), "Writes to a full FIFO");
		TEST(model.line == std::vector<uint8_t>(bytes.begin(), bytes.end()),
		     "Wrong bytes on the line");
		check_writes_follow_not_full(model);

		TEST_EQUAL(model.write_count(Name::TransmitControl),
		           size_t(1),
		           "Transmit control writes");
		TEST_EQUAL(model.transmitControl,
		           0x0001'0001U,
		           "Transmitter enabled, one stop bit, watermark 1");
		TEST_EQUAL(model.write_count(Name::InterruptEnable),
		           size_t(0),
		           "Polled transmit changed interrupt enables");
	}

	void test_stop_bits_ignored()
	{
		UartModel model{8};
		Uart      uart{&model.registers, 16'000'000};
		TEST_SUCCESS(uart.configure(
		  {.baudRate = 9'600, .stopBits = Serial::StopBits::Two}));
		const uint8_t Bytes[] = {0x55, 0xaa};
		uart.transmit_sync(Bytes);
		TEST_EQUAL(model.transmitControl,
		           0x0001'0001U,
		           "Polled transmit always uses one stop bit");
		TEST_EQUAL(model.write_count(Name::TransmitData),
		           size_t(2),
		           "Number of data writes");
		check_writes_follow_not_full(model);
	}

	void test_empty()
	{
		UartModel model;
		Uart      uart{&model.registers, 16'000'000};
		uart.transmit_sync({});
		TEST_EQUAL(model.write_count(Name::TransmitData),
		           size_t(0),
		           "Data written for an empty message");
	}
} // namespace

int test_uart_sync()
{
	test_slow_line();
	test_stop_bits_ignored();
	test_empty();
	return 0;
}
