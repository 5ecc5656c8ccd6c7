#pragma once

#include <cstdint>
#include <cstddef>
#include <unistd.h>

/// Byte counts and offsets are always i8, -1 marks "unknown".
using i1 = int8_t;
using i4 = int32_t;
using u8 = uint64_t;
using i8 = int64_t;
using isize = ssize_t;

using ci4 = const i4;
using cu8 = const u8;
using ci8 = const i8;
using cint = const int;
using cbool = const bool;
