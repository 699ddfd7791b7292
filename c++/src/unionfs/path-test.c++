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

#include "path.h"
#include <kj/test.h>

namespace unionfs {
namespace {

KJ_TEST("canonicalize") {
  KJ_EXPECT(toAbsoluteString(canonicalize("/")) == "/");
  KJ_EXPECT(toAbsoluteString(canonicalize("")) == "/");
  KJ_EXPECT(toAbsoluteString(canonicalize("/foo/bar")) == "/foo/bar");
  KJ_EXPECT(toAbsoluteString(canonicalize("/foo//bar/")) == "/foo/bar");
  KJ_EXPECT(toAbsoluteString(canonicalize("/foo/./bar")) == "/foo/bar");
  KJ_EXPECT(toAbsoluteString(canonicalize("/foo/../bar")) == "/bar");
  KJ_EXPECT(toAbsoluteString(canonicalize("/foo/bar/../..")) == "/");
  KJ_EXPECT(toAbsoluteString(canonicalize("/a/b/../c/./d/")) == "/a/c/d");

  // Relative input is taken from the root.
  KJ_EXPECT(toAbsoluteString(canonicalize("foo/bar")) == "/foo/bar");
}

KJ_TEST("canonicalize clamps at the root") {
  KJ_EXPECT(toAbsoluteString(canonicalize("/..")) == "/");
  KJ_EXPECT(toAbsoluteString(canonicalize("/../../foo")) == "/foo");
  KJ_EXPECT(toAbsoluteString(canonicalize("/foo/../../../bar")) == "/bar");
  KJ_EXPECT(canonicalize("/../..").size() == 0);
}

KJ_TEST("canonicalize equivalent spellings") {
  KJ_EXPECT(canonicalize("/foo/bar") == canonicalize("/foo/./bar/"));
  KJ_EXPECT(canonicalize("/foo/bar") == canonicalize("//foo/baz/../bar"));
  KJ_EXPECT(canonicalize("/foo") != canonicalize("/foo/bar"));
}

KJ_TEST("canonicalize relative to a base") {
  auto base = canonicalize("/foo/bar");

  KJ_EXPECT(toAbsoluteString(canonicalize(base, "baz")) == "/foo/bar/baz");
  KJ_EXPECT(toAbsoluteString(canonicalize(base, "../baz")) == "/foo/baz");
  KJ_EXPECT(toAbsoluteString(canonicalize(base, "../../../../baz")) == "/baz");
  KJ_EXPECT(toAbsoluteString(canonicalize(base, "/qux")) == "/qux");
  KJ_EXPECT(toAbsoluteString(canonicalize(base, ".")) == "/foo/bar");
  KJ_EXPECT(toAbsoluteString(canonicalize(base, "")) == "/foo/bar");
  KJ_EXPECT(toAbsoluteString(canonicalize(kj::Path(nullptr), "../x")) == "/x");
}

KJ_TEST("isAbsolute") {
  KJ_EXPECT(isAbsolute("/"));
  KJ_EXPECT(isAbsolute("/foo"));
  KJ_EXPECT(!isAbsolute("foo"));
  KJ_EXPECT(!isAbsolute(""));
  KJ_EXPECT(!isAbsolute("./foo"));
}

KJ_TEST("commonPrefixLength") {
  KJ_EXPECT(commonPrefixLength(canonicalize("/a/b/c"), canonicalize("/a/b/d")) == 2);
  KJ_EXPECT(commonPrefixLength(canonicalize("/a/b"), canonicalize("/a/b/c")) == 2);
  KJ_EXPECT(commonPrefixLength(canonicalize("/x"), canonicalize("/a")) == 0);
  KJ_EXPECT(commonPrefixLength(canonicalize("/"), canonicalize("/a")) == 0);
}

}  // namespace
}  // namespace unionfs
