#ifndef FILEOPERATIONS_HH
#define FILEOPERATIONS_HH

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>

namespace bin2s::FileOperations {

	struct FClose {
		void operator()(FILE* f) const { fclose(f); }
	};
	using FILE_t = std::unique_ptr<FILE, FClose>;

	/** Call fopen() in a platform-independent manner
	  * @param filename the file path
	  * @param mode the mode parameter, same as fopen
	  * @result A pointer to the opened file, or nullptr on error
	  *         On error the global variable 'errno' is filled in (see
	  *         man fopen for details). */
	[[nodiscard]] FILE_t openFile(const std::string& filename, const char* mode);

	/**
	 * Open an ofstream in a platform-independent manner
	 * @param stream an ofstream
	 * @param filename the file path
	 * @throw FileException when the file could not be opened
	 */
	void openOfStream(std::ofstream& stream, const std::string& filename);

	/**
	 * Call unlink() in a platform-independent manner
	 */
	int unlink(const std::string& path);

	/**
	 * Get the name of the temp directory on the system.
	 * Typically /tmp on *nix.
	 */
	[[nodiscard]] std::string getTempDir();

	/**
	 * Returns the file portion of a path name.
	 * @param path The pathname
	 * @result The file portion
	 */
	[[nodiscard]] std::string_view getFilename(std::string_view path);

	/**
	 * Returns the extension portion of a path.
	 * @param path The pathname
	 * @result The extension portion. This includes the '.'.
	 *         If path doesn't have an extension portion the result
	 *         is an empty string.
	 */
	[[nodiscard]] std::string_view getExtension(std::string_view path);

	/**
	 * Returns the path without extension.
	 * @param path The pathname
	 * @result The path without extension. This excludes the '.'.
	 *         If path doesn't have an extension portion the result
	 *         remains unchanged.
	 */
	[[nodiscard]] std::string_view stripExtension(std::string_view path);

} // namespace bin2s::FileOperations

#endif
