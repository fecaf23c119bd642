#include "FileBase.hh"

#include "FileOperations.hh"

namespace bin2s {

std::string_view FileBase::getOriginalName()
{
	// default implementation just returns filename portion of URL
	return FileOperations::getFilename(getURL());
}

} // namespace bin2s
