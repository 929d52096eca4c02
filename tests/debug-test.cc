// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#define TEST_NAME "Debug"
#include "tests.hh"
#include <interrupt.hh>
#include <limits>
#include <serial.hh>
#include <string>
#include <string_view>

using Quiet = ConditionalDebug<false, "Quiet">;

namespace
{
	/**
	 * Custom formatter, registered through the adaptor specialisation below.
	 */
	struct Baud
	{
		uint32_t rate;
	};

	void write_baud(uintptr_t value, DebugWriter &writer)
	{
		writer.write(static_cast<int32_t>(value));
		writer.write(" baud");
	}

	/**
	 * Writer that collects everything into a string.
	 */
	struct StringWriter : DebugWriter
	{
		std::string text;

		void write(char c) override
		{
			text += c;
		}
		void write(const char *str) override
		{
			text += str;
		}
		void write(std::string_view str) override
		{
			text += str;
		}
		void write(uint32_t value) override
		{
			text += std::to_string(value);
		}
		void write(int32_t value) override
		{
			text += std::to_string(value);
		}
		void write(uint64_t value) override
		{
			text += std::to_string(value);
		}
		void write(int64_t value) override
		{
			text += std::to_string(value);
		}
	};

	/**
	 * Format a message the way the debug log does and return the text.
	 */
	template<typename... Args>
	std::string formatted(const char *fmt, Args... args)
	{
		std::array<DebugFormatArgument, sizeof...(Args)> arguments;
		make_debug_arguments_list(arguments.data(), args...);
		StringWriter writer;
		debug_format(writer, fmt, arguments.data(), arguments.size());
		return writer.text;
	}
} // namespace

template<>
struct DebugFormatArgumentAdaptor<Baud>
{
	__always_inline static DebugFormatArgument construct(Baud value)
	{
		return {static_cast<uintptr_t>(value.rate),
		        DebugFormatArgumentKind::DebugFormatArgumentCallback,
		        reinterpret_cast<uintptr_t>(&write_baud)};
	}
};

namespace
{
	void test_formatting()
	{
		TEST_EQUAL(formatted("{}", static_cast<int64_t>(-1234567890123)),
		           std::string("-1234567890123"),
		           "Signed 64-bit");
		TEST_EQUAL(formatted("{}", std::numeric_limits<int64_t>::min()),
		           std::string("-9223372036854775808"),
		           "Most negative 64-bit");
		TEST_EQUAL(formatted("{}", static_cast<uint64_t>(0x1234567809012345ULL)),
		           std::string("0x1234567809012345"),
		           "Unsigned 64-bit");
		TEST_EQUAL(formatted("{}", static_cast<uint64_t>(0x2a)),
		           std::string("0x2a"),
		           "Small unsigned 64-bit");
		TEST_EQUAL(formatted("{} {}", -42, 42U),
		           std::string("-42 0x2a"),
		           "32-bit integers");
		TEST_EQUAL(formatted("{} {}", true, 'c'),
		           std::string("true c"),
		           "Boolean and character");
		TEST_EQUAL(formatted("Parity {}", Serial::Parity::Even),
		           std::string("Parity Even(0x2)"),
		           "Enumeration");
		TEST_EQUAL(formatted("{}", Baud{115'200}),
		           std::string("115200 baud"),
		           "Custom formatter");
		std::string_view view{"trimmed string view and trailing text", 21};
		TEST_EQUAL(formatted("[{}]", view),
		           std::string("[trimmed string view a]"),
		           "String view");
		TEST_EQUAL(formatted("{} and {}", 1),
		           std::string("1 and <missing argument>"),
		           "Missing argument");
		TEST_EQUAL(formatted("{} is literal"),
		           std::string("{} is literal"),
		           "No arguments");
	}

	void test_critical_section()
	{
		int result = with_interrupts_disabled(
		  []() { return with_interrupts_disabled([]() { return 42; }); });
		TEST_EQUAL(result, 42, "Nested critical section result");
		bool ran = false;
		with_interrupts_disabled([&]() { ran = true; });
		TEST(ran, "Critical section did not run");
	}
} // namespace

int test_debug()
{
	test_formatting();
	test_critical_section();
	unsigned char x = 'c';
	debug_log("Testing C++ debug log: 42:{}, true:{}, hello world:{}, "
	          "'c':{}, &x:{}, nullptr:{}",
	          42,
	          true,
	          "hello world",
	          'c',
	          &x,
	          nullptr);
	debug_log("Negative numbers: {} {}", -1, static_cast<int64_t>(-1234567890123));
	debug_log("Enumerations: {} {} {}",
	          Serial::Parity::Even,
	          Serial::StopBits::Two,
	          Serial::Error::FramingError);
	debug_log("Custom formatter: {}", Baud{115'200});
	std::string_view view{"trimmed string view and trailing text", 21};
	debug_log("String view: {}", view);
	debug_log("Missing argument: {} {}", 1);
	// Just test that these compile:
	TEST(true, "Testing C++ invariant failure: 42:{}", 42);
	TEST(true, "Testing C++ invariant failure");
	TEST(true, "Testing C++ invariant failure: 42:{}", 42, 1, 3, 4, "oops");

	{
		bool evaluated = false;
		Quiet::Assert(
		  [&]() {
			  evaluated = true;
			  return false;
		  },
		  "This assertion is disabled and must not run");
		TEST(!evaluated, "Disabled assertion evaluated its condition");
	}
	Quiet::log("This should not be printed");
	Quiet::Invariant(true, "Invariants are checked even when quiet");

	return 0;
}
