#ifndef COMPRESSEDFILEADAPTER_HH
#define COMPRESSEDFILEADAPTER_HH

#include "FileBase.hh"

#include <memory>
#include <optional>
#include <vector>

namespace bin2s {

/** Presents the uncompressed content of a compressed file. The content is
  * decompressed in full on first access.
  */
class CompressedFileAdapter : public FileBase
{
public:
	struct Decompressed {
		std::vector<uint8_t> buf;
		std::string originalName;
	};

	void read(std::span<uint8_t> buffer) final;
	[[nodiscard]] size_t getSize() final;
	void seek(size_t pos) final;
	[[nodiscard]] size_t getPos() final;
	[[nodiscard]] const std::string& getURL() const final;
	[[nodiscard]] std::string_view getOriginalName() final;

protected:
	explicit CompressedFileAdapter(std::unique_ptr<FileBase> file);
	virtual void decompress(FileBase& file, Decompressed& decompressed) = 0;

private:
	void decompress();

private:
	std::unique_ptr<FileBase> file;
	std::optional<Decompressed> decompressed;
	size_t pos = 0;
};

} // namespace bin2s

#endif
