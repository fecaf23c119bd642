#include "Identifier.hh"

#include "IdentifierException.hh"

#include <algorithm>

namespace bin2s::Identifier {

// Locale independent versions of isalpha() and isdigit().
[[nodiscard]] static constexpr bool isAsciiLetter(char c)
{
	return (('a' <= c) && (c <= 'z')) || (('A' <= c) && (c <= 'Z'));
}

[[nodiscard]] static constexpr bool isAsciiDigit(char c)
{
	return ('0' <= c) && (c <= '9');
}

[[nodiscard]] static constexpr bool isSeparator(char c)
{
	return (c == '-') || (c == '.') || (c == '/');
}

[[nodiscard]] static constexpr bool isLegal(char c)
{
	return isAsciiLetter(c) || isAsciiDigit(c) || (c == '_') || isSeparator(c);
}

std::string sanitize(std::string_view raw)
{
	std::string result;
	result.reserve(raw.size() + 1);
	for (char c : raw) {
		if (isLegal(c)) result += c;
	}
	if (result.empty()) {
		throw IdentifierException(
			"identifier \"", raw, "\" doesn't contain any legal characters");
	}

	std::ranges::replace_if(result, isSeparator, '_');
	if (isAsciiDigit(result.front())) {
		result.insert(result.begin(), '_');
	}
	return result;
}

bool isValid(std::string_view str)
{
	if (str.empty() || isAsciiDigit(str.front())) return false;
	return std::ranges::all_of(str, [](char c) {
		return isAsciiLetter(c) || isAsciiDigit(c) || (c == '_');
	});
}

} // namespace bin2s::Identifier
