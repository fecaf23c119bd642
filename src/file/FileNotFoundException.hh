#ifndef FILENOTFOUNDEXCEPTION_HH
#define FILENOTFOUNDEXCEPTION_HH

#include "FileException.hh"

namespace bin2s {

class FileNotFoundException final : public FileException
{
public:
	using FileException::FileException;
};

} // namespace bin2s

#endif
