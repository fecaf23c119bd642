#ifndef STDINFILE_HH
#define STDINFILE_HH

#include "FileBase.hh"

#include <cstdio>
#include <vector>

namespace bin2s {

/** The standard input stream, presented as a seekable file. The whole
  * stream is read on construction.
  */
class StdinFile final : public FileBase
{
public:
	/** @throws FileException when reading 'stream' fails */
	explicit StdinFile(FILE* stream = stdin);

	void read(std::span<uint8_t> buffer) override;
	[[nodiscard]] size_t getSize() override;
	void seek(size_t pos) override;
	[[nodiscard]] size_t getPos() override;
	[[nodiscard]] const std::string& getURL() const override;

private:
	std::vector<uint8_t> buf;
	size_t pos = 0;
};

} // namespace bin2s

#endif
