#ifndef STRCAT_HH
#define STRCAT_HH

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <limits>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

// strCat and strAppend()
//
// Inspired by google's absl::StrCat (similar interface, different implementation).
// See https://abseil.io/blog/20171023-cppcon-strcat


// --- Public interface ---

// Concatenate a bunch of 'printable' objects.
//
// Conceptually each object is converted to a string, all those strings are
// concatenated, and that result is returned.
//
// For example:
//      auto s = strCat("foobar", s, ' ', 123);
// is equivalent to
//      auto s = "foobar" + s + ' ' + std::to_string(123);
//
// The former immediately creates a result of the correct size instead of
// (re)allocating all intermediate strings.
template<typename... Ts>
[[nodiscard]] std::string strCat(Ts&& ...ts);

// Append a bunch of 'printable' objects to an exiting string.
//
// It's not allowed to append (a part of) a string to itself:
//     strAppend(s, s); // INVALID
template<typename... Ts>
void strAppend(std::string& result, Ts&& ...ts);

// Format an integer as a fixed-width decimal value and insert it into a
// strCat() or strAppend() sequence. Small values get leading spaces (the
// value is right-justified), values that need more than 'N' characters are
// printed in full.
//
// For example:
//    s = strCat(".byte ", dec_string<3>(7)); // ".byte   7"
////template<size_t N, std::integral T>
////strCatImpl::ConcatFixedWidthDecIntegral<N, T> dec_string(T t);

// Insert 'n' spaces into a strCat() or strAppend() sequence.
////strCatImpl::ConcatSpaces spaces(size_t t);


// --- Implementation details ---

namespace strCatImpl {

// ConcatUnit
// These implement various mechanisms to concatenate an object to a string.
// All these classes implement:
//
// - size_t size() const;
//     Returns the (exact) size in characters of the formatted object.
//
// - char* copy(char* dst) const;
//     Copy the formatted object to 'dst', returns an updated pointer.
template<typename T> struct ConcatUnit;


// The default (slow) implementation uses 'operator<<(ostream&, T)'
template<typename T>
struct ConcatUnit
{
	explicit ConcatUnit(const T& t)
		: s([&]{
			std::ostringstream os;
			os << t;
			return os.str();
		}())
	{
	}

	[[nodiscard]] size_t size() const
	{
		return s.size();
	}

	[[nodiscard]] char* copy(char* dst) const
	{
		std::ranges::copy(s, dst);
		return dst + s.size();
	}

private:
	std::string s;
};


// ConcatUnit<string_view>:
//   store the string view (copies the view, not the string)
template<> struct ConcatUnit<std::string_view>
{
	explicit ConcatUnit(const std::string_view v_)
		: v(v_)
	{
	}

	[[nodiscard]] size_t size() const
	{
		return v.size();
	}

	[[nodiscard]] char* copy(char* dst) const
	{
		std::ranges::copy(v, dst);
		return dst + v.size();
	}

private:
	std::string_view v;
};


// ConcatUnit<char>:
//   store single char (length is constant 1)
template<> struct ConcatUnit<char>
{
	explicit ConcatUnit(char c_)
		: c(c_)
	{
	}

	[[nodiscard]] size_t size() const
	{
		return 1;
	}

	[[nodiscard]] char* copy(char* dst) const
	{
		*dst = c;
		return dst + 1;
	}

private:
	char c;
};


// Helper function to take the absolute value of a signed or unsigned type.
//  (without compiler warning on 't < 0' and '-t' when t is unsigned)
template<std::unsigned_integral T>
[[nodiscard]] unsigned long long absHelper(T t) { return t; }

template<std::signed_integral T>
[[nodiscard]] unsigned long long absHelper(T t)
{
	return (t < 0) ? (0ULL - static_cast<unsigned long long>(t))
	               : static_cast<unsigned long long>(t);
}


// Optimized integer printing.
//
// Prints the value to an internal buffer. The formatted characters are
// generated from back to front, so the final result is not aligned with the
// start of this internal buffer.
template<std::integral T> struct ConcatIntegral
{
	static constexpr bool IS_SIGNED = std::numeric_limits<T>::is_signed;
	static constexpr size_t BUF_SIZE = 1 + std::numeric_limits<T>::digits10 + IS_SIGNED;

	explicit ConcatIntegral(T t)
	{
		auto p = buf.end();
		auto a = absHelper(t);

		do {
			*--p = static_cast<char>('0' + (a % 10));
			a /= 10;
		} while (a);

		if constexpr (IS_SIGNED) {
			if (t < 0) *--p = '-';
		}
		sz = static_cast<unsigned char>(buf.end() - p);
	}

	[[nodiscard]] size_t size() const
	{
		return sz;
	}

	[[nodiscard]] char* copy(char* dst) const
	{
		std::ranges::copy(std::span{data(), sz}, dst);
		return dst + sz;
	}

	[[nodiscard]] operator std::string() const
	{
		return std::string(data(), sz);
	}

private:
	[[nodiscard]] const char* data() const { return buf.data() + BUF_SIZE - sz; }

private:
	std::array<char, BUF_SIZE> buf;
	unsigned char sz;
};


// Prints a number of spaces (without constructing a temporary string).
struct ConcatSpaces
{
	explicit ConcatSpaces(size_t n_)
		: n(n_)
	{
	}

	[[nodiscard]] size_t size() const
	{
		return n;
	}

	[[nodiscard]] char* copy(char* dst) const
	{
		std::ranges::fill(std::span{dst, n}, ' ');
		return dst + n;
	}

private:
	size_t n;
};


// Format an integral as a decimal value with at least 'N' characters.
template<size_t N, std::integral T> struct ConcatFixedWidthDecIntegral
{
	explicit ConcatFixedWidthDecIntegral(T t)
		: helper(t)
	{
	}

	[[nodiscard]] size_t size() const
	{
		return std::max(N, helper.size());
	}

	[[nodiscard]] char* copy(char* dst) const
	{
		auto n2 = helper.size();
		if (n2 < N) {
			dst = ConcatSpaces(N - n2).copy(dst);
		}
		return helper.copy(dst);
	}

private:
	ConcatIntegral<T> helper;
};


// Create a 'ConcatUnit<T>' wrapper object for a given 'T' value.

// Generic version: use the operator<<(ostream&, T) based ConcatUnit<T>.
template<typename T>
	requires(!std::integral<T>)
[[nodiscard]] inline auto makeConcatUnit(const T& t)
{
	return ConcatUnit<T>(t);
}

[[nodiscard]] inline auto makeConcatUnit(const std::string& s)
{
	return ConcatUnit<std::string_view>(s);
}

[[nodiscard]] inline auto makeConcatUnit(std::string_view s)
{
	return ConcatUnit<std::string_view>(s);
}

[[nodiscard]] inline auto makeConcatUnit(const char* s)
{
	return ConcatUnit<std::string_view>(s);
}

[[nodiscard]] inline auto makeConcatUnit(char* s)
{
	return ConcatUnit<std::string_view>(s);
}

[[nodiscard]] inline auto makeConcatUnit(char c)
{
	return ConcatUnit<char>(c);
}

// Note: no ConcatIntegral<char> because that is printed as a single character
template<std::integral T>
	requires(!std::same_as<T, char> && !std::same_as<T, bool>)
[[nodiscard]] inline auto makeConcatUnit(T t)
{
	return ConcatIntegral<T>(t);
}

template<size_t N, std::integral T>
[[nodiscard]] inline auto makeConcatUnit(const ConcatFixedWidthDecIntegral<N, T>& t)
{
	return t;
}

[[nodiscard]] inline auto makeConcatUnit(const ConcatSpaces& t)
{
	return t;
}


// Calculate the total size for a bunch (a tuple) of ConcatUnit<T> objects.
template<typename... Ts>
[[nodiscard]] size_t calcTotalSize(const std::tuple<Ts...>& t)
{
	return std::apply([](const auto&... units) {
		return (size_t(0) + ... + units.size());
	}, t);
}

// Copy each ConcatUnit<T> in the given tuple to the final result.
template<typename... Ts>
void copyUnits(char* dst, const std::tuple<Ts...>& t)
{
	std::apply([&](const auto&... units) {
		((dst = units.copy(dst)), ...);
	}, t);
}

} // namespace strCatImpl


template<typename... Ts>
[[nodiscard]] std::string strCat(Ts&& ...ts)
{
	// Strategy:
	// - For each parameter (of any type) we create a ConcatUnit object.
	// - We sum the results of callings size() on all those objects.
	// - We allocate a string of that total size.
	// - We copy() each ConcatUnit into that string.

	auto t = std::tuple(strCatImpl::makeConcatUnit(std::forward<Ts>(ts))...);
	auto size = strCatImpl::calcTotalSize(t);

	std::string result;
	// Return the requested size, not the 'sz' parameter: some library
	// versions pass the (larger) capacity there.
	result.resize_and_overwrite(size, [&](char* dst, size_t /*sz*/) {
		strCatImpl::copyUnits(dst, t);
		return size;
	});
	return result;
}

// Degenerate case
[[nodiscard]] inline std::string strCat()
{
	return {};
}

template<typename... Ts>
void strAppend(std::string& result, Ts&& ...ts)
{
	auto t = std::tuple(strCatImpl::makeConcatUnit(std::forward<Ts>(ts))...);
	auto extraSize = strCatImpl::calcTotalSize(t);
	auto oldSize = result.size();

	result.resize_and_overwrite(oldSize + extraSize, [&](char* p, size_t /*sz*/) {
		// p[0..oldSize-1] still/already contains old content
		strCatImpl::copyUnits(&p[oldSize], t);
		return oldSize + extraSize;
	});
}

// Degenerate case
inline void strAppend(std::string& /*x*/)
{
	// nothing
}

template<size_t N, std::integral T>
[[nodiscard]] inline auto dec_string(T t)
{
	return strCatImpl::ConcatFixedWidthDecIntegral<N, T>{t};
}

[[nodiscard]] inline auto spaces(size_t n)
{
	return strCatImpl::ConcatSpaces{n};
}

#endif
