#include "BatchConverter.hh"

#include "ByteStreamEncoder.hh"
#include "CliComm.hh"
#include "FileException.hh"
#include "FileOperations.hh"
#include "Identifier.hh"

#include "strCat.hh"

#include <ostream>
#include <utility>
#include <vector>

namespace bin2s {

BatchConverter::BatchConverter(
		std::ostream& output_, CliComm& cliComm_,
		const AsmParameters& params_, File::OpenMode openMode_)
	: output(output_)
	, cliComm(cliComm_)
	, params(params_)
	, openMode(openMode_)
{
}

unsigned BatchConverter::convert(
	std::string_view toolName, std::span<const std::string> filenames)
{
	std::vector<File> files;
	files.reserve(filenames.size());
	try {
		params.validate();
		for (const auto& filename : filenames) {
			files.emplace_back(filename, openMode);
		}
		write(strCat("/* Generated by ", toolName,
		             " - please don't edit manually */\n"));
	} catch (Bin2sException& e) {
		throw FatalError(std::move(e).getMessage());
	}

	unsigned count = 0;
	for (auto& file : files) {
		try {
			if (convertFile(file)) {
				++count;
			} else {
				cliComm.printWarning("skipping empty file '", file.getURL(), '\'');
			}
		} catch (Bin2sException& e) {
			throw FatalError(file.getURL(), ": ", std::move(e).getMessage());
		}
		file.close();
	}
	return count;
}

bool BatchConverter::convertFile(File& file)
{
	auto name = FileOperations::getFilename(file.getOriginalName());
	auto pos = file.getPos();
	auto module = encode(name, file, params);
	if (!module) return false;

	write(*module);
	if (verbose) {
		cliComm.printInfo("converted \"", file.getURL(), "\" to symbol ",
		                  Identifier::sanitize(name), " (",
		                  file.getPos() - pos, " bytes)");
	}
	return true;
}

void BatchConverter::write(std::string_view text)
{
	output.write(text.data(), static_cast<std::streamsize>(text.size()));
	if (!output) {
		throw FileException("Error writing output");
	}
}

} // namespace bin2s
