#include "File.hh"

#include "GZFileAdapter.hh"
#include "LocalFile.hh"
#include "StdinFile.hh"

#include <algorithm>
#include <array>
#include <memory>

namespace bin2s {

File::File() = default;

[[nodiscard]] static std::unique_ptr<FileBase> init(std::string filename, File::OpenMode mode)
{
	static constexpr std::array<uint8_t, 3> GZ_HEADER = {0x1F, 0x8B, 0x08};

	std::unique_ptr<FileBase> file;
	if (filename == "-") {
		file = std::make_unique<StdinFile>();
	} else {
		file = std::make_unique<LocalFile>(std::move(filename));
	}
	if ((mode == File::OpenMode::DECOMPRESS) && (file->getSize() >= GZ_HEADER.size())) {
		std::array<uint8_t, GZ_HEADER.size()> buf;
		file->read(buf);
		file->seek(0);
		if (std::ranges::equal(buf, GZ_HEADER)) {
			file = std::make_unique<GZFileAdapter>(std::move(file));
		}
	}
	return file;
}

File::File(std::string filename, OpenMode mode)
	: file(init(std::move(filename), mode))
{
}

File::File(File&& other) noexcept
	: file(std::move(other.file))
{
}

File::File(std::unique_ptr<FileBase> file_)
	: file(std::move(file_))
{
}

File::~File() = default;

File& File::operator=(File&& other) noexcept
{
	file = std::move(other.file);
	return *this;
}

void File::close()
{
	file.reset();
}

void File::read(std::span<uint8_t> buffer)
{
	file->read(buffer);
}

size_t File::getSize()
{
	return file->getSize();
}

void File::seek(size_t pos)
{
	file->seek(pos);
}

size_t File::getPos()
{
	return file->getPos();
}

const std::string& File::getURL() const
{
	return file->getURL();
}

std::string_view File::getOriginalName()
{
	std::string_view orig = file->getOriginalName();
	return !orig.empty() ? orig : getURL();
}

} // namespace bin2s
