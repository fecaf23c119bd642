#include <catch2/catch.hpp>
#include "File.hh"
#include "FileException.hh"
#include "FileOperations.hh"

#include <zlib.h>

#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <vector>

using namespace bin2s;

struct GzHeaderFields {
	std::string name;    // FNAME
	std::string comment; // FCOMMENT
	std::string extra;   // FEXTRA
	bool headerCrc = false;
};

// Compress 'content' into a gzip stream, with the given optional header
// fields.
[[nodiscard]] static std::vector<uint8_t> gzipData(std::string_view content, GzHeaderFields fields)
{
	z_stream s = {};
	REQUIRE(deflateInit2(&s, Z_BEST_COMPRESSION, Z_DEFLATED, MAX_WBITS + 16,
	                     8, Z_DEFAULT_STRATEGY) == Z_OK);

	gz_header header = {};
	header.os = 3; // unix
	if (!fields.name.empty()) {
		header.name = reinterpret_cast<Bytef*>(fields.name.data());
	}
	if (!fields.comment.empty()) {
		header.comment = reinterpret_cast<Bytef*>(fields.comment.data());
	}
	if (!fields.extra.empty()) {
		header.extra = reinterpret_cast<Bytef*>(fields.extra.data());
		header.extra_len = static_cast<uInt>(fields.extra.size());
	}
	header.hcrc = fields.headerCrc ? 1 : 0;
	REQUIRE(deflateSetHeader(&s, &header) == Z_OK);

	std::vector<uint8_t> result(deflateBound(&s, static_cast<uLong>(content.size())) +
	                            fields.name.size() + fields.comment.size() +
	                            fields.extra.size() + 64);
	s.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(content.data()));
	s.avail_in = static_cast<uInt>(content.size());
	s.next_out = result.data();
	s.avail_out = static_cast<uInt>(result.size());
	int err = deflate(&s, Z_FINISH);
	deflateEnd(&s);
	REQUIRE(err == Z_STREAM_END);
	result.resize(s.total_out);
	return result;
}

static void createFile(const std::string& filename, std::span<const uint8_t> content)
{
	std::ofstream of(filename, std::ios::binary);
	of.write(reinterpret_cast<const char*>(content.data()),
	         static_cast<std::streamsize>(content.size()));
}

[[nodiscard]] static std::string readAll(File& file)
{
	std::vector<uint8_t> buf(file.getSize() - file.getPos());
	file.read(buf);
	return {buf.begin(), buf.end()};
}

TEST_CASE("GZFileAdapter: decompress")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_gz_unittest.bin.gz";
	std::string content;
	for (int i = 0; i < 10000; ++i) content += "0123456789abcdef"[i % 16];
	auto compressed = gzipData(content, {});
	REQUIRE(compressed.size() < content.size());
	createFile(filename, compressed);

	SECTION("decompress mode yields the original bytes") {
		File file(filename, File::OpenMode::DECOMPRESS);
		CHECK(file.getSize() == content.size());
		CHECK(readAll(file) == content);
		// no name in the header: strip the .gz extension
		CHECK(file.getOriginalName() == "bin2s_gz_unittest.bin");
		CHECK(file.getURL() == filename);
	}
	SECTION("normal mode yields the raw bytes") {
		File file(filename);
		CHECK(file.getSize() == compressed.size());
		CHECK(readAll(file) == std::string(compressed.begin(), compressed.end()));
		CHECK(file.getOriginalName() == "bin2s_gz_unittest.bin.gz");
	}
	CHECK(FileOperations::unlink(filename) == 0);
}

TEST_CASE("GZFileAdapter: original name from header")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_gz_name_unittest.gz";
	createFile(filename, gzipData("hello_world", {.name = "sprites.chr"}));

	{
		File file(filename, File::OpenMode::DECOMPRESS);
		CHECK(file.getOriginalName() == "sprites.chr");
		CHECK(readAll(file) == "hello_world");
	}
	CHECK(FileOperations::unlink(filename) == 0);
}

TEST_CASE("GZFileAdapter: corrupt input")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_gz_corrupt_unittest.gz";
	auto compressed = gzipData("some data that will be cut short", {});
	compressed.resize(compressed.size() / 2);
	createFile(filename, compressed);

	{
		File file(filename, File::OpenMode::DECOMPRESS);
		CHECK_THROWS_AS(file.getSize(), FileException);
	}
	CHECK(FileOperations::unlink(filename) == 0);
}

TEST_CASE("GZFileAdapter: optional header fields")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_gz_fields_unittest.gz";

	SECTION("extra field, comment and header crc") {
		createFile(filename, gzipData("payload", {
			.name = "", .comment = "a comment", .extra = "extra-field", .headerCrc = true}));
		File file(filename, File::OpenMode::DECOMPRESS);
		CHECK(readAll(file) == "payload");
		CHECK(file.getOriginalName() == "bin2s_gz_fields_unittest");
	}
	SECTION("all fields") {
		createFile(filename, gzipData("payload", {
			.name = "inner.bin", .comment = "c", .extra = "XY", .headerCrc = true}));
		File file(filename, File::OpenMode::DECOMPRESS);
		CHECK(readAll(file) == "payload");
		CHECK(file.getOriginalName() == "inner.bin");
	}
	CHECK(FileOperations::unlink(filename) == 0);
}

TEST_CASE("GZFileAdapter: truncated header")
{
	auto filename = FileOperations::getTempDir() + "/bin2s_gz_header_unittest.gz";
	auto compressed = gzipData("data", {.name = "a_rather_long_original_name.bin"});
	compressed.resize(16); // cut inside the stored name
	createFile(filename, compressed);

	{
		File file(filename, File::OpenMode::DECOMPRESS);
		CHECK_THROWS_AS(file.getSize(), FileException);
		CHECK_THROWS_AS(file.getOriginalName(), FileException);
	}
	CHECK(FileOperations::unlink(filename) == 0);
}
