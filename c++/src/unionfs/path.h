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

#include "common.h"
#include <kj/filesystem.h>

UNIONFS_BEGIN_HEADER

namespace unionfs {

// Lexical path handling for the union namespace.
//
// A canonical path is represented as a kj::Path whose components are taken relative to the
// union's root, so the empty path is "/". Unlike kj::Path::eval(), which refuses to let ".."
// escape the starting directory, ".." here clamps at the root the way it does in a POSIX
// namespace. None of these functions touch a backend.

kj::Path canonicalize(kj::StringPtr path);
// Resolves "." and ".." segments and drops empty segments. A relative input is taken relative
// to the root. Never fails, except for a NUL character inside a component (which KJ rejects as a
// precondition).

kj::Path canonicalize(kj::PathPtr base, kj::StringPtr text);
// Evaluates `text` relative to the canonical directory `base`. An absolute `text` replaces
// `base` entirely. Used to interpret a relative symlink target against the directory holding
// the link.

kj::String toAbsoluteString(kj::PathPtr path);
// "/" for the root, "/a/b" otherwise.

bool isAbsolute(kj::StringPtr path);

size_t commonPrefixLength(kj::PathPtr a, kj::PathPtr b);
// Number of leading components `a` and `b` share.

}  // namespace unionfs

UNIONFS_END_HEADER
