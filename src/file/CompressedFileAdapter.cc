#include "CompressedFileAdapter.hh"

#include "FileException.hh"

#include <algorithm>
#include <utility>

namespace bin2s {

CompressedFileAdapter::CompressedFileAdapter(std::unique_ptr<FileBase> file_)
	: file(std::move(file_))
{
}

void CompressedFileAdapter::decompress()
{
	if (decompressed) return;

	Decompressed d;
	decompress(*file, d);
	decompressed = std::move(d);
}

void CompressedFileAdapter::read(std::span<uint8_t> buffer)
{
	decompress();
	if (decompressed->buf.size() < (pos + buffer.size())) {
		throw FileException("Read beyond end of file \"", getURL(), '"');
	}
	std::ranges::copy(std::span{decompressed->buf}.subspan(pos, buffer.size()),
	                  buffer.begin());
	pos += buffer.size();
}

size_t CompressedFileAdapter::getSize()
{
	decompress();
	return decompressed->buf.size();
}

void CompressedFileAdapter::seek(size_t newPos)
{
	pos = newPos;
}

size_t CompressedFileAdapter::getPos()
{
	return pos;
}

const std::string& CompressedFileAdapter::getURL() const
{
	return file->getURL();
}

std::string_view CompressedFileAdapter::getOriginalName()
{
	decompress();
	return decompressed->originalName;
}

} // namespace bin2s
