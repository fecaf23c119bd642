#ifndef ASMMODULEBUILDER_HH
#define ASMMODULEBUILDER_HH

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace bin2s {

/** Composes the text of one GNU assembler module that exports a read-only
  * byte array. The module consists of (in this order):
  *  - preamble():   section, alignment and the three '.global' symbols
  *  - startLabel(): '<id>:'
  *  - byteLine():   one '.byte' directive per call
  *  - endLabel():   '<id>_end:'
  *  - trailer():    '<id>_size: .int <size>'
  * All symbol names are derived from the identifier given to the
  * constructor, which must already be a legal symbol (see
  * Identifier::sanitize()).
  */
class AsmModuleBuilder
{
public:
	/** Width of the (right-justified) decimal field of a single byte. */
	static constexpr size_t BYTE_FIELD_WIDTH = 3;

	explicit AsmModuleBuilder(std::string identifier);

	AsmModuleBuilder& preamble(int alignment);
	AsmModuleBuilder& startLabel();
	AsmModuleBuilder& byteLine(std::span<const uint8_t> bytes);
	AsmModuleBuilder& endLabel();
	AsmModuleBuilder& trailer(size_t size);

	[[nodiscard]] const std::string& getIdentifier() const { return identifier; }
	[[nodiscard]] std::string_view getText() const { return text; }
	/** Hand out the composed text, leaves this builder empty. */
	[[nodiscard]] std::string finish() { return std::move(text); }

	[[nodiscard]] std::string startSymbol() const;
	[[nodiscard]] std::string endSymbol() const;
	[[nodiscard]] std::string sizeSymbol() const;

private:
	const std::string identifier;
	std::string text;
};

} // namespace bin2s

#endif
