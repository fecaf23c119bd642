#ifndef MEMORYBUFFERFILE_HH
#define MEMORYBUFFERFILE_HH

#include "FileBase.hh"

namespace bin2s {

class File;

class MemoryBufferFile final : public FileBase
{
public:
	explicit MemoryBufferFile(std::span<const uint8_t> buffer_)
		: buffer(buffer_) {}

	void read(std::span<uint8_t> dst) override;

	size_t getSize() override;
	void seek(size_t newPos) override;
	size_t getPos() override;

	const std::string& getURL() const override;

private:
	std::span<const uint8_t> buffer;
	size_t pos = 0;
};

File memory_buffer_file(std::span<const uint8_t> buffer);

} // namespace bin2s

#endif
