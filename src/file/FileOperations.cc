#include "FileOperations.hh"

#include "FileException.hh"

#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <cstdlib>
#include <cstring> // for strchr, strerror

namespace bin2s::FileOperations {

FILE_t openFile(const std::string& filename, const char* mode)
{
	// Mode must contain a 'b' character. On unix this doesn't make any
	// difference. But on windows this is required to open the file
	// in binary mode.
	assert(strchr(mode, 'b'));
	return FILE_t(fopen(filename.c_str(), mode));
}

void openOfStream(std::ofstream& stream, const std::string& filename)
{
	stream.open(filename.c_str(), std::ios::out | std::ios::trunc);
	if (!stream.is_open()) {
		int err = errno;
		throw FileException(
			"Error opening output file \"", filename, "\": ",
			strerror(err));
	}
}

int unlink(const std::string& path)
{
	return ::unlink(path.c_str());
}

std::string getTempDir()
{
	const char* result = getenv("TMPDIR");
	if (!result || !*result) result = getenv("TMP");
	if (!result || !*result) result = getenv("TEMP");
	if (!result || !*result) result = "/tmp";
	return result;
}

std::string_view getFilename(std::string_view path)
{
	if (auto pos = path.rfind('/'); pos != std::string_view::npos) {
		return path.substr(pos + 1);
	}
	return path;
}

std::string_view getExtension(std::string_view path)
{
	std::string_view filename = getFilename(path);
	if (auto pos = filename.rfind('.'); pos != std::string_view::npos) {
		return filename.substr(pos);
	}
	return {};
}

std::string_view stripExtension(std::string_view path)
{
	if (auto pos = path.rfind('.'); pos != std::string_view::npos) {
		return path.substr(0, pos);
	}
	return path;
}

} // namespace bin2s::FileOperations
