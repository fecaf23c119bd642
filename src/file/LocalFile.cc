#include "LocalFile.hh"

#include "FileException.hh"
#include "FileNotFoundException.hh"

#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <cstdio>
#include <cstring> // for strerror
#include <utility>

namespace bin2s {

LocalFile::LocalFile(std::string filename_)
	: filename(std::move(filename_))
{
	file = FileOperations::openFile(filename, "rb");
	if (!file) {
		int err = errno;
		if (err == ENOENT) {
			throw FileNotFoundException(
				"File \"", filename, "\" not found");
		} else {
			throw FileException(
				"Error opening file \"", filename, "\": ",
				strerror(err));
		}
	}
	(void)getSize(); // query filesize, but ignore result
}

void LocalFile::read(std::span<uint8_t> buffer)
{
	if (fread(buffer.data(), 1, buffer.size(), file.get()) != buffer.size()) {
		if (ferror(file.get())) {
			throw FileException("Error reading file \"", filename, '"');
		}
		if (feof(file.get())) {
			throw FileException("Read beyond end of file \"", filename, '"');
		}
	}
}

size_t LocalFile::getSize()
{
	struct stat st;
	int ret = fstat(fileno(file.get()), &st);
	if (ret && (errno == EOVERFLOW)) {
		// on 32-bit systems, the fstat() call returns a EOVERFLOW
		// error in case the file is bigger than (1<<31)-1 bytes
		throw FileException("Files >= 2GB are not supported on "
		                    "32-bit platforms: ", getURL());
	}
	if (ret) {
		throw FileException("Cannot get size of file \"", filename, '"');
	}
	if (!S_ISREG(st.st_mode)) {
		throw FileException("Not a regular file: \"", filename, '"');
	}
	return static_cast<size_t>(st.st_size);
}

void LocalFile::seek(size_t pos)
{
	if (fseek(file.get(), static_cast<long>(pos), SEEK_SET) != 0) {
		throw FileException("Error seeking file \"", filename, '"');
	}
}

size_t LocalFile::getPos()
{
	long pos = ftell(file.get());
	if (pos < 0) {
		throw FileException("Error querying position in file \"", filename, '"');
	}
	return static_cast<size_t>(pos);
}

const std::string& LocalFile::getURL() const
{
	return filename;
}

} // namespace bin2s
