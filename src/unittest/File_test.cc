#include <catch2/catch.hpp>
#include "File.hh"
#include "FileException.hh"
#include "FileNotFoundException.hh"
#include "FileOperations.hh"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

using namespace bin2s;

static void createFile(const std::string& filename, std::string_view content)
{
	std::ofstream of(filename, std::ios::binary);
	of.write(content.data(), static_cast<std::streamsize>(content.size()));
}

TEST_CASE("File: read local file")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_file_unittest.bin";
	createFile(filename, "hello_world");

	{
		File file(filename);
		CHECK(file.is_open());
		CHECK(file.getURL() == filename);
		CHECK(file.getOriginalName() == "bin2s_file_unittest.bin");
		CHECK(file.getSize() == 11);
		CHECK(file.getPos() == 0);

		std::vector<uint8_t> buf(5);
		file.read(buf);
		CHECK(std::string(buf.begin(), buf.end()) == "hello");
		CHECK(file.getPos() == 5);

		file.seek(6);
		file.read(buf);
		CHECK(std::string(buf.begin(), buf.end()) == "world");
		CHECK(file.getPos() == 11);

		// reading past the end fails
		CHECK_THROWS_AS(file.read(buf), FileException);

		file.close();
		CHECK(!file.is_open());
	}
	CHECK(FileOperations::unlink(filename) == 0);
}

TEST_CASE("File: move")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_file_move_unittest.bin";
	createFile(filename, "abc");

	File file1(filename);
	File file2(std::move(file1));
	CHECK(file2.is_open());
	CHECK(file2.getSize() == 3);

	File file3;
	CHECK(!file3.is_open());
	file3 = std::move(file2);
	CHECK(file3.is_open());
	CHECK(file3.getURL() == filename);

	file3.close();
	CHECK(FileOperations::unlink(filename) == 0);
}

TEST_CASE("File: errors")
{
	auto tmp = FileOperations::getTempDir();

	// a FileNotFoundException is also a FileException
	CHECK_THROWS_AS(File(tmp + "/bin2s_no_such_file_unittest.bin"), FileNotFoundException);
	CHECK_THROWS_AS(File(tmp + "/bin2s_no_such_file_unittest.bin"), FileException);

	try {
		File file(tmp + "/bin2s_no_such_file_unittest.bin");
		FAIL("expected FileNotFoundException");
	} catch (FileNotFoundException& e) {
		CHECK(e.getMessage() == "File \"" + tmp + "/bin2s_no_such_file_unittest.bin\" not found");
	}

	// directories can't be converted
	CHECK_THROWS_AS(File(tmp), FileException);
}

TEST_CASE("File: decompress mode leaves plain files alone")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_file_plain_unittest.bin";
	createFile(filename, std::string_view("\x1f\x8b", 2)); // too short for a gzip header

	{
		File file(filename, File::OpenMode::DECOMPRESS);
		CHECK(file.getSize() == 2);
		CHECK(file.getPos() == 0);
		CHECK(file.getOriginalName() == "bin2s_file_plain_unittest.bin");
	}
	CHECK(FileOperations::unlink(filename) == 0);
}
