// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <debug.hh>
#include <interrupt.hh>
#include <string.h>
#ifdef SIFIVE_DEBUG_CONSOLE_BASE
#	include <platform/sifive/platform-uart.hh>
#else
#	include <stdio.h>
#endif

namespace
{
#ifdef SIFIVE_DEBUG_CONSOLE_BASE
	/**
	 * The UART used for debug output.  The SDK never configures this one, the
	 * boot code is expected to have set its divisor.
	 */
	volatile SiFiveUartRegisters<> *console_uart()
	{
		return reinterpret_cast<volatile SiFiveUartRegisters<> *>(
		  static_cast<uintptr_t>(SIFIVE_DEBUG_CONSOLE_BASE));
	}
#endif

	/**
	 * Formatter for debug messages.  This implements the `DebugWriter`
	 * interface on top of a single-character `write`, which subclasses provide
	 * to pick where the output goes.  Custom callbacks are handed the printer
	 * itself, so their output is formatted the same way.
	 */
	struct DebugPrinter : DebugWriter
	{
		using DebugWriter::write;

		/**
		 * Write a null-terminated C string.
		 */
		void write(const char *str) override
		{
			if (str == nullptr)
			{
				write("(null)");
				return;
			}
			for (; *str; ++str)
			{
				write(*str);
			}
		}

		/**
		 * Write a string view.
		 */
		void write(std::string_view str) override
		{
			for (char c : str)
			{
				write(c);
			}
		}

		/**
		 * Write a boolean.
		 */
		void write(bool b)
		{
			write(b ? "true" : "false");
		}

		/**
		 * Write a raw pointer as a hex string.
		 */
		void write(const void *ptr)
		{
			write(static_cast<uint64_t>(reinterpret_cast<uintptr_t>(ptr)));
		}

		/**
		 * Write a signed integer, as a decimal string.
		 */
		void write(int32_t s) override
		{
			write(static_cast<int64_t>(s));
		}

		/**
		 * Write a signed integer, as a decimal string.
		 */
		void write(int64_t s) override
		{
			// Negate in the unsigned domain so that the most negative value
			// does not overflow.
			uint64_t magnitude = static_cast<uint64_t>(s);
			if (s < 0)
			{
				write('-');
				magnitude = 0 - magnitude;
			}
			std::array<char, 20> buf;
			const char           Digits[] = "0123456789";
			for (int i = int(buf.size() - 1); i >= 0; i--)
			{
				buf[static_cast<size_t>(i)] = Digits[magnitude % 10];
				magnitude /= 10;
			}
			bool skipZero = true;
			for (auto c : buf)
			{
				if (skipZero && (c == '0'))
				{
					continue;
				}
				skipZero = false;
				write(c);
			}
			if (skipZero)
			{
				write('0');
			}
		}

		/**
		 * Write a 32-bit unsigned integer to the buffer as hex with no prefix.
		 */
		void append_hex_word(uint32_t s, bool skipLeadingZeroes)
		{
			std::array<char, 8> buf;
			const char          Hexdigits[] = "0123456789abcdef";
			// Length of string including null terminator
			static_assert(sizeof(Hexdigits) == 0x11);
			for (long i = long(buf.size() - 1); i >= 0; i--)
			{
				buf.at(static_cast<size_t>(i)) = Hexdigits[s & 0xf];
				s >>= 4;
			}
			bool skipZero = skipLeadingZeroes;
			for (auto c : buf)
			{
				if (skipZero && (c == '0'))
				{
					continue;
				}
				skipZero = false;
				write(c);
			}
			if (skipZero)
			{
				write('0');
			}
		}

		/**
		 * Write a 32-bit unsigned integer to the buffer as hex.
		 */
		void write(uint32_t s) override
		{
			write('0');
			write('x');
			append_hex_word(s, true);
		}

		/**
		 * Write a 64-bit unsigned integer to the buffer as hex.
		 */
		void write(uint64_t s) override
		{
			write('0');
			write('x');
			uint32_t hi = static_cast<uint32_t>(s >> 32);
			uint32_t lo = static_cast<uint32_t>(s);
			if (hi != 0)
			{
				append_hex_word(hi, true);
			}
			append_hex_word(lo, hi == 0);
		}

		/**
		 * Format a message, using the provided arguments.
		 */
		void format(const char          *fmt,
		            DebugFormatArgument *arguments,
		            size_t               argumentsCount)
		{
			// If there are no format arguments, just write the string.
			if (argumentsCount == 0)
			{
				write(fmt);
				return;
			}
			size_t argumentIndex = 0;
			for (const char *s = fmt; *s != 0; ++s)
			{
				if (s[0] == '{' && s[1] == '}')
				{
					s++;
					if (argumentIndex >= argumentsCount)
					{
						write("<missing argument>");
						continue;
					}
					auto &argument = arguments[argumentIndex++];
					switch (static_cast<DebugFormatArgumentKind>(argument.kind))
					{
						case DebugFormatArgumentKind::DebugFormatArgumentBool:
							write(static_cast<bool>(argument.value));
							break;
						case DebugFormatArgumentKind::
						  DebugFormatArgumentCharacter:
							write(static_cast<char>(argument.value));
							break;
						case DebugFormatArgumentKind::DebugFormatArgumentPointer:
							write(reinterpret_cast<const void *>(argument.value));
							break;
						case DebugFormatArgumentKind::
						  DebugFormatArgumentSignedNumber32:
							write(static_cast<int32_t>(argument.value));
							break;
						case DebugFormatArgumentKind::
						  DebugFormatArgumentUnsignedNumber32:
							write(static_cast<uint32_t>(argument.value));
							break;
						case DebugFormatArgumentKind::
						  DebugFormatArgumentSignedNumber64:
						{
							int64_t value;
							memcpy(&value,
							       reinterpret_cast<const void *>(argument.value),
							       sizeof(value));
							write(value);
							break;
						}
						case DebugFormatArgumentKind::
						  DebugFormatArgumentUnsignedNumber64:
						{
							uint64_t value;
							memcpy(&value,
							       reinterpret_cast<const void *>(argument.value),
							       sizeof(value));
							write(value);
							break;
						}
						case DebugFormatArgumentKind::DebugFormatArgumentCString:
							write(reinterpret_cast<const char *>(argument.value));
							break;
						case DebugFormatArgumentKind::
						  DebugFormatArgumentStringView:
							write(*reinterpret_cast<const std::string_view *>(
							  argument.value));
							break;
						case DebugFormatArgumentKind::DebugFormatArgumentCallback:
							reinterpret_cast<DebugCallback>(argument.callback)(
							  argument.value, *this);
							break;
						default:
							write("<invalid argument kind>");
							break;
					}
					continue;
				}
				write(*s);
			}
		}
	};

	/**
	 * Printer that writes to the debug console.
	 */
	struct ConsolePrinter final : DebugPrinter
	{
		using DebugPrinter::write;

#ifdef SIFIVE_DEBUG_CONSOLE_BASE
		/**
		 * The interrupt-driven driver may share the console UART and turns
		 * its transmitter off when idle, so make sure that it is on.
		 */
		ConsolePrinter()
		{
			console_uart()->transmit_enable();
		}
#endif

		/**
		 * Write a character to the console.
		 */
		void write(char c) override
		{
#ifdef SIFIVE_DEBUG_CONSOLE_BASE
			console_uart()->blocking_write(static_cast<uint8_t>(c));
#else
			fputc(c, stderr);
#endif
		}
	};

	/**
	 * Printer that forwards each character to another writer.
	 */
	struct ForwardingPrinter final : DebugPrinter
	{
		using DebugPrinter::write;

		/// The destination.
		DebugWriter &out;

		explicit ForwardingPrinter(DebugWriter &writer) : out(writer) {}

		void write(char c) override
		{
			out.write(c);
		}
	};

} // namespace

void debug_format(DebugWriter         &writer,
                  const char          *fmt,
                  DebugFormatArgument *arguments,
                  size_t               argumentsCount)
{
	ForwardingPrinter printer{writer};
	printer.format(fmt, arguments, argumentsCount);
}

void debug_log_message_write(const char          *context,
                             const char          *format,
                             DebugFormatArgument *messages,
                             size_t               messageCount)
{
	with_interrupts_disabled([&]() {
		ConsolePrinter printer;
		printer.write("\x1b[35m");
		printer.write(context);
		printer.write("\033[0m: ");
		printer.format(format, messages, messageCount);
		printer.write("\n");
	});
}

void debug_report_failure(const char          *kind,
                          const char          *file,
                          const char          *function,
                          int                  line,
                          const char          *format,
                          DebugFormatArgument *arguments,
                          size_t               argumentCount)
{
	with_interrupts_disabled([&]() {
		ConsolePrinter printer;
		printer.write("\x1b[35m");
		printer.write(file);
		printer.write(":");
		printer.write(static_cast<int32_t>(line));
		printer.write("\x1b[31m ");
		printer.write(kind);
		printer.write(" failure\x1b[35m in ");
		printer.write(function);
		printer.write("\x1b[36m\n");
		printer.format(format, arguments, argumentCount);
		printer.write("\033[0m\n");
	});
}
