#ifndef _PEGKIT_HPP_
#define _PEGKIT_HPP_
/*****************************************************************************
  PEG matcher combinators, plus a small grammar-tree interpreter on top

    A matcher is just a function of (input, position) that either consumes
    some prefix of the input and gives back a value, or fails with a
    structured diagnostic (never by throwing). Everything else is built by
    wrapping matchers into other matchers: sequences, ordered choices,
    repetitions, lookaheads, value transforms, named captures, recursive
    rules, memoization.

    For quick jobs, grammars can also be written as plain Rule trees in
    LISP-ish brace notation, and run by a Parser (see grammar.hpp).

  NOTE:

  - Offsets count bytes of the (UTF-8) input, but line/column count
    characters. Broken UTF-8 is read byte by byte (as U+FFFD).

  - Matchers don't own the input: it must outlive (and stay unchanged
    during) the calls. The Parser, OTOH, copies the text it parses.

  - Failures are values; exceptions (std::runtime_error, via ERROR()) are
    only thrown for building something nonsensical (empty literal, undefined
    rule etc.), or for asking value_of() a failure.

  - If you need to #include this in more than one translation units, then
    #define PEGKIT_DEDUP for all but the first one. (This way the most
    common use case of only including it once can be kept the simplest.)

 *****************************************************************************/

#include "pegkit/base.hpp"
#include "pegkit/position.hpp"
#include "pegkit/diagnostic.hpp"
#include "pegkit/outcome.hpp"
#include "pegkit/primitives.hpp"
#include "pegkit/combinators.hpp"
#include "pegkit/repetition.hpp"
#include "pegkit/lookahead.hpp"
#include "pegkit/transform.hpp"
#include "pegkit/capture.hpp"
#include "pegkit/rules.hpp"
#include "pegkit/memo.hpp"
#include "pegkit/report.hpp"
#include "pegkit/grammar.hpp"

//!! My cute little macros conflict with e.g. the Windows headers (included by DocTest)!
#undef CONST
#undef OUT
#undef ERROR
#endif // _PEGKIT_HPP_
