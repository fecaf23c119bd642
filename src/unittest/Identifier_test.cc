#include <catch2/catch.hpp>
#include "Identifier.hh"
#include "IdentifierException.hh"

#include <string>

using namespace bin2s;

static void checkSanitize(std::string_view raw, std::string_view expected)
{
	auto result = Identifier::sanitize(raw);
	CHECK(result == expected);
	CHECK(Identifier::isValid(result));
	// sanitizing a legal identifier is a no-op
	CHECK(Identifier::sanitize(result) == result);
}

TEST_CASE("Identifier::sanitize")
{
	SECTION("examples") {
		checkSanitize("foo.bin", "foo_bin");
		checkSanitize("4bit.chr", "_4bit_chr");
		checkSanitize("$bar$8", "bar8");
		checkSanitize("~~13/boo", "_13_boo");
	}
	SECTION("separators") {
		checkSanitize("a/b-c.d", "a_b_c_d");
		checkSanitize("gfx/sprites/player-1.png", "gfx_sprites_player_1_png");
		checkSanitize(".hidden", "_hidden");
		checkSanitize("-", "_");
		checkSanitize("___", "___");
	}
	SECTION("leading digit") {
		checkSanitize("123", "_123");
		checkSanitize("0", "_0");
		checkSanitize("1.2", "_1_2");
		// digit only becomes leading after stripping
		checkSanitize("@9lives", "_9lives");
	}
	SECTION("already legal") {
		checkSanitize("hello_world", "hello_world");
		checkSanitize("_start", "_start");
		checkSanitize("ABCxyz789", "ABCxyz789");
	}
	SECTION("illegal characters are dropped") {
		checkSanitize("my file (1).bin", "myfile1_bin");
		checkSanitize("caf\xC3\xA9.txt", "caf_txt");
		checkSanitize(std::string("a\0b", 3), "ab");
	}
	SECTION("no legal characters") {
		CHECK_THROWS_AS(Identifier::sanitize(""), IdentifierException);
		CHECK_THROWS_AS(Identifier::sanitize("$$$"), IdentifierException);
		CHECK_THROWS_AS(Identifier::sanitize("~ !@#%^&*()"), IdentifierException);
		CHECK_THROWS_AS(Identifier::sanitize("\xC3\xA9\xC3\xA9"), IdentifierException);
	}
}

TEST_CASE("Identifier::isValid")
{
	CHECK(Identifier::isValid("a"));
	CHECK(Identifier::isValid("_"));
	CHECK(Identifier::isValid("_123"));
	CHECK(Identifier::isValid("foo_bin"));
	CHECK(Identifier::isValid("Z9_z"));

	CHECK(!Identifier::isValid(""));
	CHECK(!Identifier::isValid("1abc"));
	CHECK(!Identifier::isValid("foo.bin"));
	CHECK(!Identifier::isValid("foo-bin"));
	CHECK(!Identifier::isValid("a/b"));
	CHECK(!Identifier::isValid("a b"));
	CHECK(!Identifier::isValid("$x"));
}
