#pragma once
#include <cdefs.h>
#include <stddef.h>
#include <stdint.h>

/**
 * The kind of value, for values that have special-cased handling.
 */
enum DebugFormatArgumentKind : uintptr_t
{
	/// Boolean, printed as "true" or "false".
	DebugFormatArgumentBool,
	/// Single character.
	DebugFormatArgumentCharacter,
	/// Signed 32-bit integer, printed as decimal.
	DebugFormatArgumentSignedNumber32,
	/// Unsigned 32-bit integer, printed as hexadecimal
	DebugFormatArgumentUnsignedNumber32,
	/// Signed 64-bit integer, printed as decimal.
	DebugFormatArgumentSignedNumber64,
	/// Unsigned 64-bit integer, printed as hexadecimal.
	DebugFormatArgumentUnsignedNumber64,
	/// Pointer, printed as an address.
	DebugFormatArgumentPointer,
	/// C string, printed as-is.
	DebugFormatArgumentCString,
	/// String view, printed as-is.
	DebugFormatArgumentStringView,
	/// Custom type, printed by the function in the `callback` field.
	DebugFormatArgumentCallback,
};

struct DebugFormatArgument
{
	/**
	 * The value that is being written.
	 */
	uintptr_t value;
	/**
	 * The kind of value that is being written, one of the `Kind`
	 * enumeration.
	 */
	uintptr_t kind;
	/**
	 * A pointer to a `DebugCallback` if `kind` is
	 * `DebugFormatArgumentCallback`, zero otherwise.  Without capability tags
	 * there is no way to tell a function pointer from a kind value, so the
	 * callback has its own field.
	 */
	uintptr_t callback;
};

__BEGIN_DECLS

/**
 * Library function that writes a debug message.  This runs with interrupts
 * disabled (to avoid interleaving) and prints an array of debug messages. This
 * is intended to allow a single call to print multiple format strings without
 * requiring the format strings to be copied, so that the debugging APIs can
 * wrap a user-provided format string.
 */
void debug_log_message_write(const char                 *context,
                             const char                 *format,
                             struct DebugFormatArgument *messages,
                             size_t                      messageCount);

/**
 * Helper to write a debug message reporting an assertion or invariant failure.
 * This should be used only with the helper templates in `debug.hh`.
 * This takes the kind of failure (for example, assert or invariant), the file,
 * function, and line number where the failure occurred, a format string, and
 * an array of arguments to the format string.
 */
void debug_report_failure(const char                 *kind,
                          const char                 *file,
                          const char                 *function,
                          int                         line,
                          const char                 *fmt,
                          struct DebugFormatArgument *arguments,
                          size_t                      argumentCount);

__END_DECLS
