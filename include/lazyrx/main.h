#pragma once

// Name:      main.h
// Copyright: LazyRX authors 2025

#include <cstdarg>
#include <cstdint>
#include <type_traits>

#define LAZYRX_VERSION_MAJOR 1
#define LAZYRX_VERSION_MINOR 0

#ifndef IS
#define IS ==
#endif

typedef const char * CSTRING;

#ifndef LAZYRX_FLAG_OPERATORS
#define LAZYRX_FLAG_OPERATORS(ENUMTYPE) \
inline constexpr ENUMTYPE operator | (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(std::underlying_type_t<ENUMTYPE>(a) | std::underlying_type_t<ENUMTYPE>(b)); } \
inline constexpr ENUMTYPE operator & (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(std::underlying_type_t<ENUMTYPE>(a) & std::underlying_type_t<ENUMTYPE>(b)); } \
inline constexpr ENUMTYPE operator ~ (ENUMTYPE a) { return ENUMTYPE(~std::underlying_type_t<ENUMTYPE>(a)); } \
inline constexpr ENUMTYPE operator ^ (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(std::underlying_type_t<ENUMTYPE>(a) ^ std::underlying_type_t<ENUMTYPE>(b)); } \
inline ENUMTYPE &operator |= (ENUMTYPE &a, ENUMTYPE b) { a = a | b; return a; } \
inline ENUMTYPE &operator &= (ENUMTYPE &a, ENUMTYPE b) { a = a & b; return a; }
#endif

// Error codes.  Messages for each code are returned by lrx::GetErrorMsg().

enum class ERR : int {
   Okay = 0,
   NullArgs,
   Args,
   Syntax,
   Search,
   NoData,
   File,
   Read,
   InvalidValue,
   Terminate,
   END
};

// Log message flags.

enum class VLF : uint32_t {
   NIL = 0,
   BRANCH = 0x00000001,
   ERROR = 0x00000002,
   WARNING = 0x00000004,
   CRITICAL = 0x00000008,
   INFO = 0x00000010,
   API = 0x00000020,
   DETAIL = 0x00000040,
   TRACE = 0x00000080,
   FUNCTION = 0x00000100,
};

LAZYRX_FLAG_OPERATORS(VLF)

// Regex compilation flags.

enum class REGEX : uint32_t {
   NIL = 0,
   ICASE = 0x00000001,
   MULTILINE = 0x00000002,
   DOT_ALL = 0x00000004,
};

LAZYRX_FLAG_OPERATORS(REGEX)

// Config flags.

enum class CNF : uint32_t {
   NIL = 0,
   STRIP_QUOTES = 0x00000001,
};

LAZYRX_FLAG_OPERATORS(CNF)

namespace lrx {

// Logging (lib_log.cpp)

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args);
ERR FuncError(CSTRING Header, ERR Code);
void LogReturn(void);
int AdjustLogLevel(int Delta);
void SetLogLevel(int Level);
int GetLogLevel(void);

// Errors (lib_errors.cpp)

CSTRING GetErrorMsg(ERR Code);

} // namespace lrx
