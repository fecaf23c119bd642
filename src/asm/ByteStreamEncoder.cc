#include "ByteStreamEncoder.hh"

#include "AsmModuleBuilder.hh"
#include "Identifier.hh"

#include "File.hh"

#include <algorithm>
#include <utility>
#include <vector>

namespace bin2s {

// Common part of both encode() variants. 'readChunk' fills the given
// buffer with the next chunk of the payload.
template<typename ReadChunk>
[[nodiscard]] static std::string buildModule(
	std::string identifier, size_t size, const AsmParameters& params,
	ReadChunk readChunk)
{
	AsmModuleBuilder builder(std::move(identifier));
	builder.preamble(params.alignment)
	       .startLabel();

	auto lineLength = static_cast<size_t>(params.lineLength);
	std::vector<uint8_t> chunk(std::min(lineLength, size));
	for (size_t remaining = size; remaining != 0; /**/) {
		std::span<uint8_t> line{chunk.data(), std::min(lineLength, remaining)};
		readChunk(line);
		builder.byteLine(line);
		remaining -= line.size();
	}

	builder.endLabel()
	       .trailer(size);
	return builder.finish();
}

std::optional<std::string> encode(
	std::string_view name, File& input, const AsmParameters& params)
{
	params.validate();
	auto identifier = Identifier::sanitize(name);

	auto fileSize = input.getSize();
	auto pos = input.getPos();
	auto size = (pos < fileSize) ? (fileSize - pos) : 0;
	if (size == 0) return std::nullopt;

	return buildModule(std::move(identifier), size, params,
		[&](std::span<uint8_t> line) { input.read(line); });
}

std::optional<std::string> encode(
	std::string_view name, std::span<const uint8_t> payload,
	const AsmParameters& params)
{
	params.validate();
	auto identifier = Identifier::sanitize(name);

	if (payload.empty()) return std::nullopt;

	return buildModule(std::move(identifier), payload.size(), params,
		[&](std::span<uint8_t> line) {
			std::ranges::copy(payload.first(line.size()), line.begin());
			payload = payload.subspan(line.size());
		});
}

} // namespace bin2s
