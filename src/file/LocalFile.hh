#ifndef LOCALFILE_HH
#define LOCALFILE_HH

#include "FileBase.hh"
#include "FileOperations.hh"

#include <string>

namespace bin2s {

/** A file on the local file system, opened for reading.
  */
class LocalFile final : public FileBase
{
public:
	explicit LocalFile(std::string filename);

	void read(std::span<uint8_t> buffer) override;
	[[nodiscard]] size_t getSize() override;
	void seek(size_t pos) override;
	[[nodiscard]] size_t getPos() override;
	[[nodiscard]] const std::string& getURL() const override;

private:
	std::string filename;
	FileOperations::FILE_t file;
};

} // namespace bin2s

#endif
