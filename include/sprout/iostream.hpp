// sprout - Packrat PEG engine with extensible syntax trees in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SPROUT_INCLUDE_SPROUT_IOSTREAM_HPP
#define SPROUT_INCLUDE_SPROUT_IOSTREAM_HPP

#include <sprout/sprout.hpp>

#include <cstdio>
#include <iostream>
#include <iterator>
#include <string>

#ifndef SPROUT_NO_ISATTY
#ifdef _MSC_VER
#ifndef SPROUT_HAS_ISATTY_MSVC
#define SPROUT_HAS_ISATTY_MSVC
#endif
#else
#ifndef SPROUT_HAS_ISATTY_POSIX
#ifdef __has_include
#if __has_include(<unistd.h>)
#define SPROUT_HAS_ISATTY_POSIX
#endif
#endif
#endif
#endif
#endif // SPROUT_NO_ISATTY

#if defined SPROUT_HAS_ISATTY_MSVC
#include <io.h>
#elif defined SPROUT_HAS_ISATTY_POSIX
#include <unistd.h>
#endif

namespace sprout {

enum class source_options : std::uint_least8_t { none = 0, interactive = 1, is_bitfield_enum };

[[nodiscard]] inline bool stdin_isatty() noexcept
{
#if defined SPROUT_HAS_ISATTY_MSVC
	return _isatty(_fileno(stdin)) != 0;
#elif defined SPROUT_HAS_ISATTY_POSIX
	return isatty(fileno(stdin)) != 0;
#else
	return false;
#endif
}

// Copies characters to output until end of stream, or in interactive mode
// through the next delimiter. Fails the stream when nothing was read.
template <class CharT, class Traits, class OutputIt>
std::basic_istream<CharT, Traits>& readsource(std::basic_istream<CharT, Traits>& input, OutputIt output, CharT delim, source_options options = source_options::none)
{
	typename std::basic_istream<CharT, Traits>::sentry sentry{input, true};
	if (!sentry)
		return input;
	std::streamsize count = 0;
	for (typename std::basic_istream<CharT, Traits>::int_type ch = input.rdbuf()->sgetc(); ; ch = input.rdbuf()->snextc()) {
		if (Traits::eq_int_type(ch, Traits::eof())) {
			input.setstate(std::ios_base::eofbit);
			break;
		}
		*output = Traits::to_char_type(ch);
		++output;
		++count;
		if (Traits::eq_int_type(ch, Traits::to_int_type(delim)) && ((options & source_options::interactive) != source_options::none)) {
			input.rdbuf()->sbumpc();
			break;
		}
	}
	if (count == 0)
		input.setstate(std::ios_base::failbit);
	return input;
}

template <class CharT, class Traits, class OutputIt>
inline std::basic_istream<CharT, Traits>& readsource(std::basic_istream<CharT, Traits>& input, OutputIt output, source_options options = source_options::none)
{
	return sprout::readsource(input, output, input.widen('\n'), options);
}

// Reads one complete source text, a single line when interactive.
[[nodiscard]] inline bool readsource(std::istream& input, std::string& text, source_options options = source_options::none)
{
	text.clear();
	return static_cast<bool>(sprout::readsource(input, std::back_inserter(text), options));
}

inline std::ostream& operator<<(std::ostream& out, syntax_position const& position)
{
	return out << position.line << ':' << position.column;
}

} // namespace sprout

#endif
