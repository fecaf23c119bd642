#ifndef GZFILEADAPTER_HH
#define GZFILEADAPTER_HH

#include "CompressedFileAdapter.hh"

namespace bin2s {

class GZFileAdapter final : public CompressedFileAdapter
{
public:
	explicit GZFileAdapter(std::unique_ptr<FileBase> file);

private:
	void decompress(FileBase& file, Decompressed& decompressed) override;
};

} // namespace bin2s

#endif
