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

#include "backend.h"
#include <kj/function.h>
#include <kj/time.h>

UNIONFS_BEGIN_HEADER

namespace unionfs {

// Backends built on top of a kj::Directory: KJ's in-memory directories, host directories
// opened through kj::newDiskFilesystem(), or any other kj::Directory implementation.

typedef kj::ConstFunction<bool(kj::PathPtr path)> ModificationPolicy;
typedef kj::ConstFunction<kj::Maybe<kj::Array<kj::byte>>(kj::PathPtr path, kj::StringPtr name)>
    XattrLookup;

struct BackendOptions {
  kj::Path root = nullptr;
  // Where the directory sits in the union namespace. Union paths under `root` map onto the
  // directory; anything outside it does not exist on this backend. The root itself always
  // exists, so a backend bound at its mount prefix never needs that directory created.

  kj::Maybe<ModificationPolicy> modificationPolicy;
  // Answers supportsModifications(). When absent, every path is modifiable.

  kj::Maybe<XattrLookup> xattrs;
  // Answers getXattr(). When absent, attributes are read with fgetxattr() from the node's file
  // descriptor if the directory implementation exposes one, and are otherwise absent.
};

kj::Own<const Backend> newDirectoryBackend(
    kj::Own<const kj::Directory> directory, BackendOptions options = {});

kj::Own<const Backend> newInMemoryBackend(const kj::Clock& clock, BackendOptions options = {});
// Backend over kj::newInMemoryDirectory(clock). Timestamps come from `clock`, which must
// outlive the backend.

}  // namespace unionfs

UNIONFS_END_HEADER
