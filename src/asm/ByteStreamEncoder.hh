#ifndef BYTESTREAMENCODER_HH
#define BYTESTREAMENCODER_HH

#include "AsmParameters.hh"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bin2s {

class File;

/** Convert binary data to a GNU assembler module that defines:
  *  - '<id>':      an array of bytes containing the data
  *  - '<id>_end':  the location directly after the end of the data
  *  - '<id>_size': an unsigned int containing the length of the data
  * where '<id>' is 'name' passed through Identifier::sanitize().
  *
  * The data are the bytes from the current position of 'input' up to its
  * end. Exactly that many bytes are consumed from 'input'.
  *
  * @result The module text, or an empty optional when there are no bytes
  *         to encode.
  * @throws ParameterException when 'params' are not valid
  * @throws IdentifierException when 'name' has no legal characters
  * @throws FileException when reading 'input' fails
  */
[[nodiscard]] std::optional<std::string> encode(
	std::string_view name, File& input, const AsmParameters& params = {});

/** As above, but encodes an in-memory block of data.
  */
[[nodiscard]] std::optional<std::string> encode(
	std::string_view name, std::span<const uint8_t> payload,
	const AsmParameters& params = {});

} // namespace bin2s

#endif
