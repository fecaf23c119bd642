#ifndef VERSION_HH
#define VERSION_HH

#include <string>

namespace bin2s {

class Version
{
public:
	// Defined by build system:
	static const bool RELEASE;
	static const char* const VERSION;
	static const char* const REVISION;

	// Computed using constants above:
	static std::string full();
};

} // namespace bin2s

#endif
