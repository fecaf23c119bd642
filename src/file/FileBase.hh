#ifndef FILEBASE_HH
#define FILEBASE_HH

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace bin2s {

class FileBase
{
public:
	virtual ~FileBase() = default;

	virtual void read(std::span<uint8_t> buffer) = 0;
	[[nodiscard]] virtual size_t getSize() = 0;
	virtual void seek(size_t pos) = 0;
	[[nodiscard]] virtual size_t getPos() = 0;

	[[nodiscard]] virtual const std::string& getURL() const = 0;
	[[nodiscard]] virtual std::string_view getOriginalName();
};

} // namespace bin2s

#endif
