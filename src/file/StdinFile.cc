#include "StdinFile.hh"

#include "FileException.hh"

#include <algorithm>
#include <array>

namespace bin2s {

StdinFile::StdinFile(FILE* stream)
{
	std::array<uint8_t, 4096> chunk;
	while (true) {
		auto n = fread(chunk.data(), 1, chunk.size(), stream);
		buf.insert(buf.end(), chunk.begin(), chunk.begin() + n);
		if (n == chunk.size()) continue;
		if (ferror(stream)) {
			throw FileException("Error reading ", getURL());
		}
		break; // end of stream
	}
}

void StdinFile::read(std::span<uint8_t> buffer)
{
	if (buf.size() < (pos + buffer.size())) {
		throw FileException("Read beyond end of ", getURL());
	}
	std::ranges::copy(std::span{buf}.subspan(pos, buffer.size()), buffer.begin());
	pos += buffer.size();
}

size_t StdinFile::getSize()
{
	return buf.size();
}

void StdinFile::seek(size_t newPos)
{
	pos = newPos;
}

size_t StdinFile::getPos()
{
	return pos;
}

const std::string& StdinFile::getURL() const
{
	static const std::string URL = "<stdin>";
	return URL;
}

} // namespace bin2s
