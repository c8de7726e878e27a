#pragma once

// ============================================================
// platform.hpp -- OS headers and portable integer types
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>

   inline std::string last_os_error_str() {
       DWORD err = GetLastError();
       char buf[256] = {0};
       FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                      nullptr, err, 0, buf, sizeof(buf), nullptr);
       std::string s = buf;
       // Remove trailing CR/LF
       while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
       return s + " (err=" + std::to_string(err) + ")";
   }

#else // POSIX
#  include <sys/types.h>
#  include <unistd.h>
#  include <fcntl.h>
#  include <errno.h>
#  include <cstring>

   inline std::string last_os_error_str() {
       int err = errno;
       return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
   }
#endif

// ---- Project-wide constants ----

// Top-level folder every pathname entry is rooted at.
static constexpr const char* UNIPACK_DEFAULT_ROOT_FOLDER = "Assets";
// Sidecar suffix carrying an asset's identifier.
static constexpr const char* UNIPACK_META_SUFFIX = ".meta";
// Length of a global identifier in hex characters.
static constexpr size_t UNIPACK_GUID_HEX_LEN = 32;

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
