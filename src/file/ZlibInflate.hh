#ifndef ZLIBINFLATE_HH
#define ZLIBINFLATE_HH

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <zlib.h>

namespace bin2s {

class ZlibInflate
{
public:
	explicit ZlibInflate(std::span<const uint8_t> input);
	ZlibInflate(const ZlibInflate&) = delete;
	ZlibInflate(ZlibInflate&&) = delete;
	ZlibInflate& operator=(const ZlibInflate&) = delete;
	ZlibInflate& operator=(ZlibInflate&&) = delete;
	~ZlibInflate();

	void skip(size_t num);
	[[nodiscard]] uint8_t getByte();
	[[nodiscard]] unsigned get16LE();
	[[nodiscard]] std::string getCString();

	/** Inflate the remaining (raw deflate) input.
	  * @throws FileException on corrupt input
	  */
	[[nodiscard]] std::vector<uint8_t> inflate(size_t sizeHint = 65536);

private:
	z_stream s;
	bool wasInit = false;
};

} // namespace bin2s

#endif
