#ifndef COMMANDLINEPARSER_HH
#define COMMANDLINEPARSER_HH

#include "AsmParameters.hh"
#include "CLIOption.hh"
#include "File.hh"

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bin2s {

class CommandLineParser
{
public:
	enum class Status : uint8_t { UNPARSED, RUN, EXIT };

	CommandLineParser();
	void registerOption(std::string_view str, CLIOption& cliOption);
	void parse(std::span<char*> argv);
	[[nodiscard]] Status getParseStatus() const;

	[[nodiscard]] std::string_view getProgramName() const { return programName; }
	[[nodiscard]] const AsmParameters& getParameters() const { return parameters; }
	[[nodiscard]] std::span<const std::string> getInputFiles() const { return inputFiles; }
	/** Empty when the output goes to stdout. */
	[[nodiscard]] const std::string& getOutputFilename() const { return outputOption.filename; }
	[[nodiscard]] File::OpenMode getOpenMode() const {
		return gunzipOption.enabled ? File::OpenMode::DECOMPRESS : File::OpenMode::NORMAL;
	}
	[[nodiscard]] bool isQuiet() const { return quietOption.enabled; }
	[[nodiscard]] bool isVerbose() const { return verboseOption.enabled; }

	/** Usage, description and options, in registration order. */
	void printHelp(std::ostream& os) const;

private:
	struct OptionData {
		std::string_view name;
		CLIOption* option;
	};

	[[nodiscard]] CLIOption* findOption(std::string_view name) const;
	[[nodiscard]] bool parseOption(const std::string& arg, std::span<std::string>& cmdLine);

private:
	std::vector<OptionData> options; // sorted on name
	// all names of an option (e.g. "-a, --alignment"), in registration order
	std::vector<std::pair<const CLIOption*, std::string>> helpItems;
	std::vector<std::string> inputFiles;
	std::string programName = "bin2s";
	AsmParameters parameters;
	Status parseStatus = Status::UNPARSED;

	struct HelpOption final : CLIOption {
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		bool requested = false;
	} helpOption;

	struct VersionOption final : CLIOption {
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		bool requested = false;
	} versionOption;

	struct AlignmentOption final : CLIOption {
		explicit AlignmentOption(AsmParameters& parameters_) : parameters(parameters_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		AsmParameters& parameters;
	} alignmentOption;

	struct LineLengthOption final : CLIOption {
		explicit LineLengthOption(AsmParameters& parameters_) : parameters(parameters_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		AsmParameters& parameters;
	} lineLengthOption;

	struct OutputOption final : CLIOption {
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		std::string filename;
	} outputOption;

	struct GunzipOption final : CLIOption {
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		bool enabled = false;
	} gunzipOption;

	struct QuietOption final : CLIOption {
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		bool enabled = false;
	} quietOption;

	struct VerboseOption final : CLIOption {
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		bool enabled = false;
	} verboseOption;
};

} // namespace bin2s

#endif
