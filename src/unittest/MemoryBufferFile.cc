#include "MemoryBufferFile.hh"
#include "File.hh"
#include "FileException.hh"
#include <algorithm>
#include <memory>

namespace bin2s {

void MemoryBufferFile::read(std::span<uint8_t> dst)
{
	if (getSize() < (getPos() + dst.size())) {
		throw FileException("Read beyond end of file");
	}
	std::ranges::copy(buffer.subspan(pos, dst.size()), dst.begin());
	pos += dst.size();
}

size_t MemoryBufferFile::getSize()
{
	return buffer.size();
}

void MemoryBufferFile::seek(size_t newPos)
{
	pos = newPos;
}

size_t MemoryBufferFile::getPos()
{
	return pos;
}

const std::string& MemoryBufferFile::getURL() const
{
	static const std::string EMPTY;
	return EMPTY;
}


File memory_buffer_file(std::span<const uint8_t> buffer)
{
	return File(std::make_unique<MemoryBufferFile>(buffer));
}

} // namespace bin2s
