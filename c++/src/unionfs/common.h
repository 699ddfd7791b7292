// Copyright (c) 2026 Sandstorm Development Group, Inc. and contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include <kj/common.h>

#define UNIONFS_VERSION_MAJOR 0
#define UNIONFS_VERSION_MINOR 1
#define UNIONFS_VERSION_MICRO 0

#define UNIONFS_VERSION \
  (UNIONFS_VERSION_MAJOR * 1000000 + UNIONFS_VERSION_MINOR * 1000 + UNIONFS_VERSION_MICRO)

#define UNIONFS_BEGIN_HEADER KJ_BEGIN_HEADER
#define UNIONFS_END_HEADER KJ_END_HEADER
// Used at the top and bottom of every unionfs header, the same way KJ headers do it.

UNIONFS_BEGIN_HEADER

namespace unionfs {

typedef unsigned int uint;

static constexpr uint MAX_SYMLINK_HOPS = 40;
// Maximum number of symbolic links followed while resolving a single path, matching Linux's
// MAXSYMLINKS. Exceeding it is reported as ErrorKind::SYMLINK_LOOP.

}  // namespace unionfs

UNIONFS_END_HEADER
