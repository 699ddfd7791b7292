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
#include <kj/io.h>

UNIONFS_BEGIN_HEADER

namespace unionfs {

class Backend {
  // The capability set every storage backend bound into a UnionFilesystem must provide.
  //
  // All paths are absolute canonical paths in the union's namespace (see path.h); a backend is
  // handed exactly the path the caller used and interprets it against its own virtual root. The
  // router never rewrites them.
  //
  // Methods are const and must be safe to call concurrently, in the same sense as kj::Directory's
  // are. A backend that can't honor a call for a path it doesn't own reports it as nonexistent.

public:
  virtual ~Backend() noexcept(false) = default;

  virtual kj::Own<const Backend> clone() const = 0;
  // Returns a new reference to the same backend.

  virtual kj::Maybe<kj::FsNode::Metadata> tryStat(kj::PathPtr path, bool followSymlinks) const = 0;
  // Returns null if the path does not exist. With `followSymlinks`, links are followed only as
  // far as this backend can satisfy them itself; a link whose target this backend does not hold
  // yields null.

  virtual kj::Maybe<kj::Array<kj::String>> tryListNames(kj::PathPtr path) const = 0;
  // Names in the directory, sorted, without "." or "..". Null if the path is not a directory.

  virtual bool tryCreateDirectory(kj::PathPtr path) const = 0;
  // Creates a single directory. Returns false if something already exists at `path`. Throws if
  // the parent does not exist.

  virtual bool tryRemove(kj::PathPtr path) const = 0;
  // Deletes a file, a symlink, or an empty directory. Returns false if nothing is there. Throws
  // for a non-empty directory.

  virtual kj::Maybe<kj::Own<kj::InputStream>> tryOpenInputStream(kj::PathPtr path) const = 0;
  // Opens a file for reading, following symlinks within this backend. Null if it doesn't exist.

  virtual kj::Own<kj::OutputStream> openOutputStream(kj::PathPtr path, bool append) const = 0;
  // Opens a file for writing, creating it if needed. Without `append` the file is truncated.

  virtual bool tryCreateSymlink(kj::PathPtr linkPath, kj::StringPtr target) const = 0;
  // Creates a symlink with the given raw content. The target is not checked. Returns false if
  // `linkPath` already exists.

  virtual kj::Maybe<kj::String> tryReadlink(kj::PathPtr path) const = 0;
  // Raw content of the symlink at `path`. Null if `path` does not exist or is not a symlink.

  virtual bool tryRename(kj::PathPtr fromPath, kj::PathPtr toPath) const = 0;
  // Moves an entry within this backend, replacing a file already at `toPath`. Returns false if
  // `fromPath` does not exist.

  virtual kj::Maybe<kj::Array<kj::byte>> getXattr(kj::PathPtr path, kj::StringPtr name) const = 0;
  // Extended attribute lookup. Null means the attribute is absent.

  virtual bool supportsModifications(kj::PathPtr path) const = 0;
  // Whether mutating calls are permitted for `path`.

  // ---------------------------------------------------------------------------
  // Convenience wrappers which throw ErrorKind::NOT_FOUND instead of returning null.

  kj::FsNode::Metadata stat(kj::PathPtr path, bool followSymlinks) const;
  kj::Array<kj::String> listNames(kj::PathPtr path) const;
  kj::Own<kj::InputStream> openInputStream(kj::PathPtr path) const;
  kj::String readlink(kj::PathPtr path) const;
};

}  // namespace unionfs

UNIONFS_END_HEADER
