#ifndef STRINGOP_HH
#define STRINGOP_HH

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>
#include <system_error>

namespace StringOp
{
	/** Convert a string to an integral type 'T' (int, uint64_t, ...) in
	  * the given base.
	  * - Leading whitespace is NOT accepted.
	  * - There may NOT be any trailing character after the value.
	  * - (Only) if 'T' is a signed type, the value may start with a '-'
	  *   character. A leading '+' character is NOT accepted.
	  * - Prefixes like '0x' for hexadecimal are seen as invalid input.
	  * - It's an error if the value cannot be represented by the type 'T'.
	  */
	template<int BASE, std::integral T> [[nodiscard]] std::optional<T> stringToBase(std::string_view s);


	template<int BASE, std::integral T>
	[[nodiscard]] std::optional<T> stringToBase(std::string_view s)
	{
		T result = {}; // dummy init to avoid warning
		const auto* b = s.data();
		const auto* e = s.data() + s.size();
		if (auto [p, ec] = std::from_chars(b, e, result, BASE);
		    (ec == std::errc()) && (p == e)) {
			return result;
		}
		return std::nullopt;
	}
}

#endif
