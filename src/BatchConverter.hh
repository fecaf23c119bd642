#ifndef BATCHCONVERTER_HH
#define BATCHCONVERTER_HH

#include "AsmParameters.hh"
#include "File.hh"

#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

namespace bin2s {

class CliComm;

/** Converts a list of binary files into one stream of assembly modules.
  */
class BatchConverter
{
public:
	BatchConverter(std::ostream& output, CliComm& cliComm,
	               const AsmParameters& params,
	               File::OpenMode openMode = File::OpenMode::NORMAL);

	/** Report every converted file (symbol name and size) as info. */
	void setVerbose(bool verbose_) { verbose = verbose_; }

	/** Opens all input files ("-" is the standard input), then writes
	  * the "generated by" comment and one module per non-empty input file.
	  * Nothing is written when one of the files can't be opened. Empty
	  * files are skipped with a warning.
	  * @result The number of modules written.
	  * @throws FatalError when a file can't be opened or converted or the
	  *         output can't be written.
	  */
	unsigned convert(std::string_view toolName, std::span<const std::string> filenames);

	/** Convert the remaining content of an already opened file, without
	  * header comment.
	  * @result true iff a module was written (false for an empty file).
	  * @throws Bin2sException (or a subclass) on errors
	  */
	bool convertFile(File& file);

private:
	void write(std::string_view text);

private:
	std::ostream& output;
	CliComm& cliComm;
	const AsmParameters params;
	const File::OpenMode openMode;
	bool verbose = false;
};

} // namespace bin2s

#endif
