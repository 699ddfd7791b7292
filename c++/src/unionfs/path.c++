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
#include <kj/vector.h>
#include <kj/debug.h>

namespace unionfs {

namespace {

void evalPart(kj::Vector<kj::String>& parts, kj::ArrayPtr<const char> part) {
  if (part.size() == 0) {
    // Consecutive or trailing '/'s.
  } else if (part.size() == 1 && part[0] == '.') {
    // Current directory.
  } else if (part.size() == 2 && part[0] == '.' && part[1] == '.') {
    // ".." at the root is the root.
    if (parts.size() > 0) parts.removeLast();
  } else {
    parts.add(kj::heapString(part));
  }
}

kj::Path evalImpl(kj::Vector<kj::String>&& parts, kj::StringPtr text) {
  if (text.startsWith("/")) {
    parts.clear();
  }

  size_t partStart = 0;
  for (auto i: kj::indices(text)) {
    if (text[i] == '/') {
      evalPart(parts, text.slice(partStart, i));
      partStart = i + 1;
    }
  }
  evalPart(parts, text.slice(partStart));

  // The Path constructor validates each component, which rejects embedded NULs.
  return kj::Path(parts.releaseAsArray());
}

size_t countParts(kj::StringPtr text) {
  size_t result = 1;
  for (char c: text) {
    result += (c == '/');
  }
  return result;
}

}  // namespace

kj::Path canonicalize(kj::StringPtr path) {
  return evalImpl(kj::Vector<kj::String>(countParts(path)), path);
}

kj::Path canonicalize(kj::PathPtr base, kj::StringPtr text) {
  kj::Vector<kj::String> parts(base.size() + countParts(text));
  if (!isAbsolute(text)) {
    for (auto& p: base) parts.add(kj::heapString(p));
  }
  return evalImpl(kj::mv(parts), text);
}

kj::String toAbsoluteString(kj::PathPtr path) {
  return path.toString(true);
}

bool isAbsolute(kj::StringPtr path) {
  return path.startsWith("/");
}

size_t commonPrefixLength(kj::PathPtr a, kj::PathPtr b) {
  size_t n = kj::min(a.size(), b.size());
  for (size_t i = 0; i < n; i++) {
    if (a[i] != b[i]) return i;
  }
  return n;
}

}  // namespace unionfs
