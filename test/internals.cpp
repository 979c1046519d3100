#define PEGKIT_DEDUP
#include "../pegkit.hpp"

//---------------------------------------------------------------------------
// The base layer: debug macros (these only print in debug builds)
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Pegkit;

CASE("DBG_TRIM") {
	//! Can't pass DBG_TRIM() straight to DBG(), as fmt can't take the temporary
	//! in a debug macro... Have to actually create a var for that.
	string src = DBG_TRIM("short");
	DBG("full string: [{}]", src);
	CHECK(src == "short");

	src = DBG_TRIM("this is a long text that triggers trimming with the default length");
	DBG("trimmed: [{}]", src);
#ifndef NDEBUG
	CHECK(src.size() == DBG_DEFAULT_TRIM_LEN);
	CHECK(src.ends_with("..."));
#endif
}

CASE("DBG_, _DBG_, _DBG") {
	DBG_("Line starter...");
	_DBG_(", and a line fragment");
	_DBG_(" -- and then another line fragment --,");
	_DBG(" and a line end.");

	DBG("This should be a new line now.");
}

CASE("ERROR() is not a debug feature: it always throws") {
	// (ERROR itself is #undef'd by pegkit.hpp, so poke it via something that uses it)
	CHECK_THROWS_AS(literal(""), std::runtime_error);
	try {
		literal("");
	} catch (std::runtime_error& x) {
		CHECK(string(x.what()).starts_with("- ERROR: "));
	}
}
