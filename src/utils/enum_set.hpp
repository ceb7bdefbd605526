#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <type_traits>

template <typename T>
concept CountedEnum =
	std::is_enum_v<T>
	&& (requires { std::remove_cv_t<T>::Count; } || requires { std::remove_cv_t<T>::count; });

template <CountedEnum Enum, typename Enum_ut = std::underlying_type_t<Enum>>
consteval Enum_ut enumSize()
{
	using RawEnum = std::remove_cv_t<Enum>;

	if constexpr (requires { RawEnum::Count; }) {
		return static_cast<Enum_ut>(RawEnum::Count);
	} else {
		return static_cast<Enum_ut>(RawEnum::count);
	}
}

// Fixed-capacity flag set over a counted enum. Used for conflict policies and
// attribute filters, so it supports the usual mask algebra.
template <CountedEnum Enum, typename Enum_ut = std::underlying_type_t<Enum>>
class enum_set
{
public:
	using mask_t = uint64_t;
	static constexpr Enum_ut cMaxCapacity = 64;

	constexpr enum_set() noexcept = default;

	constexpr enum_set(std::initializer_list<Enum> init) noexcept
	{
		for (Enum e : init) {
			insert(e);
		}
	}

	constexpr void insert(Enum e) noexcept { bits |= bit(e); }
	constexpr void erase(Enum e) noexcept { bits &= ~bit(e); }
	constexpr void clear() noexcept { bits = 0; }

	[[nodiscard]]
	constexpr bool contains(Enum e) const noexcept
	{
		return bits & bit(e);
	}

	// True when every flag of 'other' is also set here. The empty set is a subset of anything.
	[[nodiscard]]
	constexpr bool containsAll(enum_set other) const noexcept
	{
		return (bits & other.bits) == other.bits;
	}

	[[nodiscard]]
	constexpr bool empty() const noexcept
	{
		return bits == 0;
	}

	[[nodiscard]]
	constexpr size_t size() const noexcept
	{
		return std::popcount(bits);
	}

	constexpr enum_set &operator|=(enum_set other) noexcept
	{
		bits |= other.bits;
		return *this;
	}
	constexpr enum_set &operator&=(enum_set other) noexcept
	{
		bits &= other.bits;
		return *this;
	}

	friend constexpr enum_set operator|(enum_set lhs, enum_set rhs) noexcept { return lhs |= rhs; }
	friend constexpr enum_set operator&(enum_set lhs, enum_set rhs) noexcept { return lhs &= rhs; }
	friend constexpr enum_set operator|(enum_set lhs, Enum rhs) noexcept { return lhs |= enum_set{rhs}; }

	constexpr bool operator==(const enum_set &) const noexcept = default;

	struct iterator
	{
		using value_type = Enum;
		using difference_type = std::ptrdiff_t;
		using iterator_category = std::input_iterator_tag;

		mask_t rest = 0;
		Enum_ut idx = N;

		constexpr iterator() noexcept = default;

		constexpr explicit iterator(mask_t mask) noexcept
			: rest(mask)
		{
			++(*this);
		}
		constexpr value_type operator*() const noexcept { return to_enum(idx); }
		constexpr iterator &operator++() noexcept
		{
			if (rest == 0) {
				idx = N;
			} else {
				idx = static_cast<Enum_ut>(std::countr_zero(rest));
				rest &= rest - 1;
			}
			return *this;
		}
		constexpr iterator operator++(int) noexcept
		{
			iterator ret = *this;
			++(*this);
			return ret;
		}
		constexpr bool operator==(const iterator &other) const noexcept { return idx == other.idx; }
	};

	constexpr iterator begin() const noexcept { return iterator(bits); }
	constexpr iterator end() const noexcept { return iterator(); }

private:
	[[nodiscard]]
	static constexpr Enum to_enum(Enum_ut idx) noexcept
	{
		return static_cast<Enum>(idx);
	}

	[[nodiscard]]
	static constexpr mask_t bit(Enum e) noexcept
	{
		return mask_t(1) << static_cast<Enum_ut>(e);
	}

private:
	static constexpr Enum_ut N = enumSize<Enum>();
	static_assert(N <= cMaxCapacity, "enum_set supports up to 64 values");

	mask_t bits = 0;
};
