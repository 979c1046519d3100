#ifndef _PEGKIT_BASE_HPP_
#define _PEGKIT_BASE_HPP_

//=============================================================================
//---------------------------------------------------------------------------
// My ad-hoc "ground-levelling" base language layer...
//---------------------------------------------------------------------------
#include <exception>
#include <stdexcept>
#include <fmt/format.h> //! GCC 12 still has no <format>, so {fmt} it is.
#include <string>
	using std::string;
	using namespace std::literals::string_literals;
#include <string_view>
	using std::string_view;
#ifndef NDEBUG
#include <iostream>
	using std::cerr, std::endl;
#endif

//!!
//!! My plain, undecorated toy macros conflict with the Windows headers (included by DocTest), and who knows what else...
//!! (They get #undef'd at the end of pegkit.hpp.)
//!!
#define CONST constexpr static auto
#define OUT

//! For variadic macros, e.g. for calling fmt::format(...):
//! GCC/CLANG and the new MSVC preproc. (/Zc:preprocessor) understand
//! __VA_OPT__(,) __VA_ARGS__; the old MSVC one just eats the extra ','.
#if defined(__GNUC__) \
	|| defined(_MSC_VER) && (!defined(_MSVC_TRADITIONAL) || !_MSVC_TRADITIONAL)
#  define _Sz_CONFORMANT_PREPROCESSOR 1
#elif defined(_MSC_VER) && defined(_MSVC_TRADITIONAL) && _MSVC_TRADITIONAL // Old MS prep.
#  define _Sz_OLD_MSVC_PREPROCESSOR 1
#endif

#ifndef NDEBUG
#  if defined(_Sz_CONFORMANT_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__)) << std::endl
     // Same as DBG(), but with no trailing \n (for continuation lines)
#    define DBG_(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__))
     // Continuation lines -- same as DBG(), but without the DBG prefix
#    define _DBG(msg, ...) std::cerr << fmt::format(msg __VA_OPT__(,) __VA_ARGS__) << std::endl
     // Line fragment -- neither DBG prefix, no trailing \n
#    define _DBG_(msg, ...) std::cerr << fmt::format(msg __VA_OPT__(,) __VA_ARGS__)
#  elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg, __VA_ARGS__)) << std::endl
#    define DBG_(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg, __VA_ARGS__))
#    define _DBG(msg, ...) std::cerr << fmt::format(msg, __VA_ARGS__) << std::endl
#    define _DBG_(msg, ...) std::cerr << fmt::format(msg, __VA_ARGS__)
#  else
#    error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#  endif

#  define DBG_DEFAULT_TRIM_LEN 30
   // Trim length is ignored as yet, just using the default:
#  define DBG_TRIM(str, ...) (std::string_view(str).length() > DBG_DEFAULT_TRIM_LEN - 3 ? \
		(std::string(std::string_view(str).substr(0, DBG_DEFAULT_TRIM_LEN - 3))) + "..." : \
		std::string(str))
#else
#  define DBG(msg, ...)
#  define DBG_(msg, ...)
#  define _DBG(msg, ...)
#  define _DBG_(msg, ...)
#  define DBG_TRIM(str, ...) std::string(str)
#endif


// Note: ERROR() below is _not_ a debug feature!
#if defined(_Sz_CONFORMANT_PREPROCESSOR)
#  define ERROR(msg, ...) throw std::runtime_error(fmt::format("- ERROR: {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__)))
#elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#  define ERROR(msg, ...) throw std::runtime_error(fmt::format("- ERROR: {}", fmt::format(msg, __VA_ARGS__)))
#else
#  error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#endif

// Tame MSVC -Wall just a little
#ifdef _MSC_VER
#  pragma warning(disable:5045) // Compiler will insert Spectre mitigation for memory load if /Qspectre switch specified
#  pragma warning(disable:4514) // unreferenced inline function has been removed
#  pragma warning(disable:4464) // relative include path contains '..'
#endif
//---------------------------------------------------------------------------
//=============================================================================

namespace Pegkit {

	inline const string EMPTY_STRING = ""s;

} // namespace Pegkit

#endif // _PEGKIT_BASE_HPP_
