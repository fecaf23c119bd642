#include <catch2/catch.hpp>
#include "ByteStreamEncoder.hh"
#include "File.hh"
#include "IdentifierException.hh"
#include "MemoryBufferFile.hh"
#include "ParameterException.hh"

#include "StringOp.hh"

#include <numeric>
#include <string>
#include <string_view>
#include <vector>

using namespace bin2s;

[[nodiscard]] static std::span<const uint8_t> asBytes(std::string_view s)
{
	return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

// Returns the values listed on each '.byte' line of the given module.
[[nodiscard]] static std::vector<std::vector<unsigned>> parseByteLines(std::string_view text)
{
	static constexpr std::string_view PREFIX = "  .byte ";
	std::vector<std::vector<unsigned>> result;
	while (!text.empty()) {
		auto eol = text.find('\n');
		auto line = text.substr(0, eol);
		text = (eol == std::string_view::npos) ? std::string_view{} : text.substr(eol + 1);
		if (!line.starts_with(PREFIX)) continue;
		line.remove_prefix(PREFIX.size());

		auto& values = result.emplace_back();
		while (true) {
			auto comma = line.find(',');
			auto field = line.substr(0, comma);
			REQUIRE(field.size() >= 3);
			auto pos = field.find_first_not_of(' ');
			REQUIRE(pos != std::string_view::npos);
			auto value = StringOp::stringToBase<10, unsigned>(field.substr(pos));
			REQUIRE(value);
			values.push_back(*value);
			if (comma == std::string_view::npos) break;
			line.remove_prefix(comma + 1);
		}
	}
	return result;
}

[[nodiscard]] static size_t declaredSize(std::string_view text, std::string_view id)
{
	auto label = std::string(id) + "_size: .int ";
	auto pos = text.find(label);
	REQUIRE(pos != std::string_view::npos);
	auto rest = text.substr(pos + label.size());
	auto value = StringOp::stringToBase<10, size_t>(rest.substr(0, rest.find('\n')));
	REQUIRE(value);
	return *value;
}

TEST_CASE("encode: hello world")
{
	std::string_view hello = "Hello World";
	auto module = encode("hello_world", asBytes(hello), AsmParameters{4, 16});
	REQUIRE(module);
	CHECK(*module ==
		"  .section .rodata\n"
		"  .balign 4\n"
		"  .global hello_world\n"
		"  .global hello_world_end\n"
		"  .global hello_world_size\n"
		"\n"
		"hello_world:\n"
		"  .byte  72,101,108,108,111, 32, 87,111,114,108,100\n"
		"\n"
		"hello_world_end:\n"
		"\n"
		"  .align\n"
		"hello_world_size: .int 11\n");

	// same result when reading from a file
	File file = memory_buffer_file(asBytes(hello));
	auto module2 = encode("hello_world", file, AsmParameters{4, 16});
	REQUIRE(module2);
	CHECK(*module2 == *module);
	CHECK(file.getPos() == hello.size());
}

TEST_CASE("encode: empty input")
{
	CHECK(!encode("empty", std::span<const uint8_t>{}));

	File file = memory_buffer_file({});
	CHECK(!encode("empty", file));

	// a fully consumed stream is empty as well
	std::string_view data = "abc";
	File file2 = memory_buffer_file(asBytes(data));
	file2.seek(3);
	CHECK(!encode("empty", file2));
	CHECK(file2.getPos() == 3);
}

TEST_CASE("encode: identifier is sanitized")
{
	std::string_view data = "x";
	auto module = encode("4bit.chr", asBytes(data));
	REQUIRE(module);
	CHECK(module->find("  .global _4bit_chr\n") != std::string::npos);
	CHECK(module->find("  .global _4bit_chr_end\n") != std::string::npos);
	CHECK(module->find("  .global _4bit_chr_size\n") != std::string::npos);
	CHECK(module->find("\n_4bit_chr:\n") != std::string::npos);
	CHECK(module->find("\n_4bit_chr_end:\n") != std::string::npos);
	CHECK(module->find("\n_4bit_chr_size: .int 1\n") != std::string::npos);

	CHECK_THROWS_AS(encode("$$$", asBytes(data)), IdentifierException);
}

TEST_CASE("encode: parameters")
{
	std::string_view data = "abcdef";

	SECTION("alignment") {
		auto module = encode("data", asBytes(data), AsmParameters{32, 16});
		REQUIRE(module);
		CHECK(module->find("  .balign 32\n") != std::string::npos);
		// the directive before the size is always without operand
		CHECK(module->find("\n  .align\ndata_size:") != std::string::npos);
	}
	SECTION("invalid") {
		CHECK_THROWS_AS(encode("data", asBytes(data), AsmParameters{0, 16}), ParameterException);
		CHECK_THROWS_AS(encode("data", asBytes(data), AsmParameters{-4, 16}), ParameterException);
		CHECK_THROWS_AS(encode("data", asBytes(data), AsmParameters{4, 0}), ParameterException);
		CHECK_THROWS_AS(encode("data", asBytes(data), AsmParameters{4, -1}), ParameterException);
	}
	SECTION("invalid parameters are reported even for empty input") {
		CHECK_THROWS_AS(encode("data", std::span<const uint8_t>{}, AsmParameters{0, 0}),
		                ParameterException);
	}
	SECTION("invalid parameters don't consume the input") {
		File file = memory_buffer_file(asBytes(data));
		CHECK_THROWS_AS(encode("data", file, AsmParameters{4, 0}), ParameterException);
		CHECK(file.getPos() == 0);
	}
}

TEST_CASE("encode: line wrapping")
{
	std::vector<uint8_t> data(256);
	std::iota(data.begin(), data.end(), uint8_t(0));

	auto check = [&](size_t size, int lineLength) {
		INFO("size=" << size << " lineLength=" << lineLength);
		auto payload = std::span<const uint8_t>{data}.first(size);
		auto module = encode("data", payload, AsmParameters{4, lineLength});
		REQUIRE(module);

		auto lines = parseByteLines(*module);
		auto len = static_cast<size_t>(lineLength);
		CHECK(lines.size() == (size + len - 1) / len);
		CHECK(lines.back().size() == ((size % len) ? (size % len) : len));

		std::vector<unsigned> all;
		for (const auto& line : lines) {
			CHECK(line.size() <= len);
			all.insert(all.end(), line.begin(), line.end());
		}
		CHECK(all.size() == declaredSize(*module, "data"));
		REQUIRE(all.size() == size);
		for (size_t i = 0; i < size; ++i) {
			CHECK(all[i] == data[i]);
		}
	};

	check(1, 16);
	check(15, 16);
	check(16, 16);
	check(17, 16);
	check(256, 16);
	check(256, 1);
	check(255, 7);
	check(3, 1000);
}

TEST_CASE("encode: values are unsigned")
{
	std::string_view data = "\x80\xff\x7f";
	auto module = encode("data", asBytes(data));
	REQUIRE(module);
	CHECK(module->find("  .byte 128,255,127\n") != std::string::npos);
}

TEST_CASE("encode: partially consumed stream")
{
	std::string_view data = "0123456789";
	File file = memory_buffer_file(asBytes(data));
	file.seek(4);

	auto module = encode("tail", file, AsmParameters{4, 4});
	REQUIRE(module);
	CHECK(file.getPos() == data.size());
	CHECK(declaredSize(*module, "tail") == 6);

	auto lines = parseByteLines(*module);
	REQUIRE(lines.size() == 2);
	CHECK(lines[0] == std::vector<unsigned>{'4', '5', '6', '7'});
	CHECK(lines[1] == std::vector<unsigned>{'8', '9'});
}

TEST_CASE("encode: deterministic")
{
	std::string_view data = "some binary \x01\x02\x03 payload";
	auto m1 = encode("blob", asBytes(data), AsmParameters{2, 5});
	auto m2 = encode("blob", asBytes(data), AsmParameters{2, 5});
	REQUIRE(m1);
	REQUIRE(m2);
	CHECK(*m1 == *m2);
}
