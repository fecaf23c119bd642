#ifndef FILE_HH
#define FILE_HH

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace bin2s {

class FileBase;

class File
{
public:
	enum class OpenMode {
		NORMAL,     // bytes as stored on disk
		DECOMPRESS, // transparently uncompress gzip files
	};

	/** Create a closed file handle.
	 * The only valid operations on such an object are is_open() and the
	 * move-assignment operator.
	 */
	File();

	/** Create file object and open underlying file.
	 * @param filename Name of the file to be opened, "-" is the
	 *                 standard input.
	 * @param mode Mode to open the file in.
	 * @throws FileNotFoundException if file not found
	 * @throws FileException for other errors
	 */
	explicit File(std::string filename, OpenMode mode = OpenMode::NORMAL);
	File(File&& other) noexcept;

	/* Used by MemoryBufferFile. */
	explicit File(std::unique_ptr<FileBase> file_);

	~File();

	File& operator=(File&& other) noexcept;

	/** Return true iff this file handle refers to an open file. */
	[[nodiscard]] bool is_open() const { return file != nullptr; }

	/** Close the current file.
	 * Equivalent to assigning a default constructed value to this object.
	 */
	void close();

	/** Read from file.
	 * @param buffer Destination address and number of bytes to read
	 * @throws FileException
	 */
	void read(std::span<uint8_t> buffer);

	/** Returns the size of this file
	 * @result The size of this file
	 * @throws FileException
	 */
	[[nodiscard]] size_t getSize();

	/** Move read/write pointer to the specified position.
	 * @param pos Position in bytes from the beginning of the file.
	 * @throws FileException
	 */
	void seek(size_t pos);

	/** Get the current position of the read/write pointer.
	 * @result Position in bytes from the beginning of the file.
	 * @throws FileException
	 */
	[[nodiscard]] size_t getPos();

	/** Returns the URL of this file object.
	 */
	[[nodiscard]] const std::string& getURL() const;

	/** Get Original filename for this object. This will usually just
	 *  return the filename portion of the URL. However for compressed
	 *  files this will be different.
	 * @result Original file name
	 * @throws FileException
	 */
	[[nodiscard]] std::string_view getOriginalName();

private:
	std::unique_ptr<FileBase> file;
};

} // namespace bin2s

#endif
