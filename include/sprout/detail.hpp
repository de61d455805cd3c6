// sprout - Packrat PEG engine with extensible syntax trees in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SPROUT_INCLUDE_SPROUT_DETAIL_HPP
#define SPROUT_INCLUDE_SPROUT_DETAIL_HPP

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace sprout {

inline namespace bitfield_ops {

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
[[nodiscard]] constexpr T operator~(T x) noexcept
{
	return static_cast<T>(~static_cast<std::underlying_type_t<T>>(x));
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
[[nodiscard]] constexpr T operator&(T x, T y) noexcept
{
	return static_cast<T>(static_cast<std::underlying_type_t<T>>(x) & static_cast<std::underlying_type_t<T>>(y));
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
[[nodiscard]] constexpr T operator|(T x, T y) noexcept
{
	return static_cast<T>(static_cast<std::underlying_type_t<T>>(x) | static_cast<std::underlying_type_t<T>>(y));
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
constexpr T& operator&=(T& x, T y) noexcept
{
	return (x = x & y);
}

template <class T, class = std::void_t<decltype(T::is_bitfield_enum)>>
constexpr T& operator|=(T& x, T y) noexcept
{
	return (x = x | y);
}

} // namespace bitfield_ops

namespace detail {

template <class T> inline constexpr bool always_false_v = false;

template <class EF>
class scope_exit
{
	static_assert(std::is_invocable_v<EF>);

	EF destructor_;

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	constexpr explicit scope_exit( Fn&& fn ) noexcept(std::is_nothrow_constructible_v<EF, Fn&&>)
		: destructor_{std::forward<Fn>(fn)}
	{}

	~scope_exit()
	{
		destructor_();
	}

	scope_exit(scope_exit const&) = delete;
	scope_exit(scope_exit&&) = delete;
	scope_exit& operator=(scope_exit const&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_exit(Fn) -> scope_exit<std::decay_t<Fn>>;

template <class Sequence>
[[nodiscard]] constexpr auto pop_back(Sequence& s) -> typename Sequence::value_type
{
	typename Sequence::value_type result{std::move(s.back())}; // NOLINT(misc-const-correctness)
	s.pop_back();
	return result;
}

[[nodiscard]] inline std::size_t hash_combine(std::size_t seed, std::size_t value) noexcept
{
	return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U)); // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
}

} // namespace detail

} // namespace sprout

#endif
