// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <optional>
#include <stddef.h>
#include <stdint.h>
#include <type_traits>
#include <utility>

namespace utils
{
	class NoCopyNoMove
	{
		public:
		NoCopyNoMove()                                = default;
		NoCopyNoMove(const NoCopyNoMove &)            = delete;
		NoCopyNoMove &operator=(const NoCopyNoMove &) = delete;
		NoCopyNoMove(NoCopyNoMove &&)                 = delete;
		NoCopyNoMove &operator=(NoCopyNoMove &&)      = delete;
		~NoCopyNoMove()                               = default;
	};

	/**
	 * A helper class modelled on `std::optional` that represents an optional
	 * `T&`.  This is stored as a pointer with `nullptr` representing the
	 * not-present version.
	 *
	 * Unlike `std::optional`, this intentionally omits the APIs that make it
	 * possible to access the value without checking that it is present.
	 *
	 * This is intended to be used as an alternative to using bare pointers to
	 * represent `T& | None`.  Drivers use it to hold non-owning references to
	 * their clients.
	 */
	template<typename T>
	class OptionalReference
	{
		/// The pointer to the real value
		T *pointer;

		public:
		/**
		 * Construct the optional wrapper from a real value.
		 */
		__always_inline OptionalReference(T &value) : pointer(&value) {}

		/**
		 * Construct the optional wrapper from not-present value.
		 */
		OptionalReference(std::nullptr_t) : pointer(nullptr) {}

		/**
		 * If this object holds a value then apply `f` to it and return the
		 * result, otherwise return the result of converting nullptr to the
		 * return type of `f`.
		 */
		__always_inline auto and_then(auto &&f)
		{
			using Result = decltype(f(std::declval<T &>()));
			if constexpr (std::is_same_v<void, Result>)
			{
				if (pointer != nullptr)
				{
					f(*pointer);
				}
				return;
			}
			else
			{
				if (pointer != nullptr)
				{
					return f(*pointer);
				}
				return Result{nullptr};
			}
		}
	};

	/**
	 * A slot that holds at most one `T` and from which the value can only be
	 * moved out.  Used to track ownership of a resource that is lent to a
	 * driver and later handed back: `take` empties the slot, so the value
	 * cannot be handed back twice.
	 */
	template<typename T>
	class TakeCell
	{
		/// The held value, if any.
		std::optional<T> value;

		public:
		/**
		 * Construct an empty cell.
		 */
		TakeCell() = default;

		/**
		 * Returns true if the cell is empty.
		 */
		[[nodiscard]] bool is_none() const
		{
			return !value.has_value();
		}

		/**
		 * Move the value out, leaving the cell empty.
		 */
		std::optional<T> take()
		{
			std::optional<T> result = std::move(value);
			value.reset();
			return result;
		}

		/**
		 * Store `newValue` and return the previous contents.
		 */
		std::optional<T> replace(T newValue)
		{
			std::optional<T> result = take();
			value.emplace(std::move(newValue));
			return result;
		}

		/**
		 * Apply `f` to a reference to the held value, if there is one.
		 * Returns true if `f` was called.
		 */
		bool map(auto &&f)
		{
			if (!value)
			{
				return false;
			}
			f(*value);
			return true;
		}
	};

} // namespace utils
