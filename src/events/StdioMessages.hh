#ifndef STDIOMESSAGES_HH
#define STDIOMESSAGES_HH

#include "CliComm.hh"

#include <iosfwd>
#include <string>

namespace bin2s {

/** Prints log messages as "<program>: <level>: <message>".
  * Everything goes to the error stream: standard output may carry the
  * generated assembly.
  */
class StdioMessages final : public CliComm
{
public:
	explicit StdioMessages(std::string programName);
	StdioMessages(std::string programName, std::ostream& out);

	/** Suppress (or re-enable) messages of level INFO. */
	void setQuiet(bool quiet_) { quiet = quiet_; }

	void log(LogLevel level, std::string_view message) override;

private:
	std::string programName;
	std::ostream& out;
	bool quiet = false;
};

} // namespace bin2s

#endif
