#ifndef IDENTIFIER_HH
#define IDENTIFIER_HH

#include <string>
#include <string_view>

namespace bin2s::Identifier {

	/** Turn an arbitrary name (typically a file name) into a legal
	  * assembler symbol:
	  * - strip all characters that are not ASCII letters, digits or one
	  *   of "_-./"
	  * - replace all of "-./" by '_'
	  * - prepend '_' if the result starts with a digit
	  * For example "foo.bin" -> "foo_bin" and "4bit.chr" -> "_4bit_chr".
	  * @throws IdentifierException if no legal character remains.
	  */
	[[nodiscard]] std::string sanitize(std::string_view raw);

	/** Returns true iff 'str' matches [_A-Za-z][_A-Za-z0-9]*.
	  */
	[[nodiscard]] bool isValid(std::string_view str);

} // namespace bin2s::Identifier

#endif
