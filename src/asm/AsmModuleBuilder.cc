#include "AsmModuleBuilder.hh"

#include "Identifier.hh"

#include "strCat.hh"

#include <cassert>
#include <utility>

namespace bin2s {

static constexpr std::string_view INDENT = "  ";

AsmModuleBuilder::AsmModuleBuilder(std::string identifier_)
	: identifier(std::move(identifier_))
{
	assert(Identifier::isValid(identifier));
}

std::string AsmModuleBuilder::startSymbol() const
{
	return identifier;
}

std::string AsmModuleBuilder::endSymbol() const
{
	return strCat(identifier, "_end");
}

std::string AsmModuleBuilder::sizeSymbol() const
{
	return strCat(identifier, "_size");
}

AsmModuleBuilder& AsmModuleBuilder::preamble(int alignment)
{
	assert(alignment > 0);
	strAppend(text,
	          INDENT, ".section .rodata\n",
	          INDENT, ".balign ", alignment, '\n',
	          INDENT, ".global ", startSymbol(), '\n',
	          INDENT, ".global ", endSymbol(), '\n',
	          INDENT, ".global ", sizeSymbol(), "\n"
	          "\n");
	return *this;
}

AsmModuleBuilder& AsmModuleBuilder::startLabel()
{
	strAppend(text, startSymbol(), ":\n");
	return *this;
}

AsmModuleBuilder& AsmModuleBuilder::byteLine(std::span<const uint8_t> bytes)
{
	assert(!bytes.empty());
	strAppend(text, INDENT, ".byte ");
	const char* separator = "";
	for (uint8_t b : bytes) {
		strAppend(text, separator, dec_string<BYTE_FIELD_WIDTH>(b));
		separator = ",";
	}
	text += '\n';
	return *this;
}

AsmModuleBuilder& AsmModuleBuilder::endLabel()
{
	strAppend(text, '\n', endSymbol(), ":\n");
	return *this;
}

AsmModuleBuilder& AsmModuleBuilder::trailer(size_t size)
{
	strAppend(text, '\n',
	          INDENT, ".align\n",
	          sizeSymbol(), ": .int ", size, '\n');
	return *this;
}

} // namespace bin2s
