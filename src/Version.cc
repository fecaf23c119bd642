#include "Version.hh"

#include "strCat.hh"

namespace bin2s {

#include "Version.ii"

std::string Version::full()
{
	std::string result = strCat("bin2s ", VERSION);
	if (!RELEASE && (REVISION[0] != '\0')) strAppend(result, '-', REVISION);
	return result;
}

} // namespace bin2s
