#define PEGKIT_DEDUP
#include "../pegkit.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

// Global env. for the test cases...
using namespace Pegkit;

CASE("SAVE_AS: basic") {
	Parser p(_{
		_{_OPT, "_WHITESPACES"},
		_{_SAVE_AS, "key", "_ID"},
		_{_OPT, "_WHITESPACES"},
		"=",
		_{_OPT, "_WHITESPACES"},
		_{_SAVE_AS, "value", "_DIGITS"}
	}); p.syntax.DUMP();

	CHECK(p.captures.empty());

	CHECK(p.parse("option = 1"));
		CHECK(p.captures.size() == 2);
		CHECK(p["key"] == "option");
		CHECK(p["value"] == "1");
	CHECK(p.parse("  also_OK_with_leading_spaces = 0"));
		CHECK(p["key"] == "also_OK_with_leading_spaces");
	CHECK(p.parse("   also_OK_with_trailing_spaces = 12   "));
		CHECK(p["value"] == "12");
	CHECK(!p.parse(" this is not an option = 1"));
		CHECK(p.captures.empty());
		CHECK(p["key"] == "");
	CHECK(!p.parse("nor_this = one"));
}

CASE("SAVE_AS: structured, with implicit SEQ shorthand") {
	Parser p(_{
		_{_OPT, "_WHITESPACES"},
		_{_SAVE_AS, "assignment",
			"_ID",
			_{_OPT, "_WHITESPACES"},
			"=",
			_{_OPT, "_WHITESPACES"},
			"_DIGITS"
		},
	});

	CHECK(p.parse("  capture_this = 1  "));
		CHECK(p["assignment"] == "capture_this = 1");
	CHECK(p.parse("  or_this = 1 // Wow, fake comments! :) "));
		CHECK(p["assignment"] == "or_this = 1");
	CHECK(!p.parse("not_this = one"));
}

CASE("SAVE_AS: nested") {
	Rule code = _{_MANY, _{_OR, "_ID", "=", "_DIGITS", ";", "_WHITESPACES"} };
	Rule block_in = _{"<", _{_SAVE_AS, "inner", _{_OPT, code}}, ">"};
	Rule block_out = _{"<", _{_SAVE_AS, "outer",
				_{_OPT, code}, _{_OPT, block_in}, _{_OPT, code},
			}, ">"};

	Parser p(block_out); p.syntax.DUMP();

	CHECK(p.parse("<outer <inner> block>"));
	CHECK(p["inner"] == "inner");
	CHECK(p["outer"] == "outer <inner> block");

	CHECK(p.parse("<outer < x = 1; y = 22; > block>"));
	CHECK(p["inner"] == " x = 1; y = 22; "); //! Mind the spaces...
	CHECK(p["inner"] !=  "x = 1; y = 22;" ); //! Mind the spaces...
	CHECK(p["outer"] == "outer < x = 1; y = 22; > block");
}

CASE("SAVE_AS: in a loop, the last one wins") {
	Parser p(_{_MANY, _{_SAVE_AS, "item", "_LETTERS"}, _{_OPT, ","}});
	CHECK(p.parse("a,bb,ccc"));
	CHECK(p.captures.size() == 1);
	CHECK(p["item"] == "ccc");
}

CASE("SAVE_AS: through _OR and _REPEAT") {
	Parser p(_{
		_{_OR, _{_SAVE_AS, "num", "_DIGITS"}, _{_SAVE_AS, "id", "_ID"}},
		_{_REPEAT, "{1,2}", _{"/", _{_SAVE_AS, "suffix", "_LETTERS"}}}
	});
	CHECK(p.parse("42/kg/m"));
	CHECK(p["num"] == "42");
	CHECK(p["id"] == "");
	CHECK(p["suffix"] == "m");

	CHECK(p.parse("speed/s"));
	CHECK(p["id"] == "speed");
	CHECK(p["num"] == "");
}

CASE("SAVE_AS: captures reach the outcome value") {
	Parser p(_{_SAVE_AS, "all", _{_MANY, "_DIGIT"}});
	REQUIRE(p.parse("123"));
	auto c = std::any_cast<Captures>(&p.outcome().value());
	REQUIRE(c);
	CHECK(c->at<string>("all") == "123");
}

CASE("SAVE_AS: across rules") {
	Parser p(_{
		_{_DEF, "pair", _{_{_SAVE_AS, "k", "_ID"}, ":", _{_SAVE_AS, "v", "_ALNUMS"}}},
		"{", _{_USE, "pair"}, "}"
	});
	CHECK(p.parse("{width:100}"));
	CHECK(p["k"] == "width");
	CHECK(p["v"] == "100");
}

CASE("SAVE_AS: bad ones") {
	CHECK_THROWS_AS(Parser(_{_SAVE_AS, "name"}), std::runtime_error);
	CHECK_THROWS_AS(Parser(_{_SAVE_AS, _{"x"}, "x"}), std::runtime_error);
	CHECK_THROWS_AS(Parser(_{_SAVE_AS, "", "x"}), std::runtime_error);
}
