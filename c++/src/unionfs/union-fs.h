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
#include <kj/map.h>

UNIONFS_BEGIN_HEADER

namespace unionfs {

struct Mount {
  kj::String prefix;
  // Absolute path at which `backend` is bound. Canonicalized by the UnionFilesystem.

  kj::Own<const Backend> backend;
};

class UnionFilesystem {
  // Presents several backends as a single hierarchical namespace.
  //
  // Each backend is bound to a prefix of the namespace. A path is owned by the backend bound to
  // its longest matching prefix; paths matched by no prefix belong to the default backend.
  // Paths are canonicalized lexically before routing, so "." and ".." never let a caller reach a
  // backend other than the one the canonical path names.
  //
  // The mount table is fixed at construction. All methods are const and may be called from any
  // thread; consistency of the data under a mount is that backend's business.
  //
  // Errors raised by the router itself carry an ErrorDetail (see error.h). Anything thrown by a
  // backend propagates unchanged.

public:
  UnionFilesystem(kj::Array<Mount> mounts, kj::Own<const Backend> defaultBackend);
  // Throws ErrorKind::CONFIGURATION if `defaultBackend` is null, if a prefix is not absolute or
  // its backend is null, or if two prefixes name the same canonical path.

  KJ_DISALLOW_COPY_AND_MOVE(UnionFilesystem);

  // ---------------------------------------------------------------------------
  // Routing

  const Backend& route(kj::PathPtr path) const;
  const Backend& route(kj::StringPtr path) const;
  // Returns the backend which owns `path`. The string form canonicalizes first.

  kj::Path adjustPath(kj::PathPtr path, const Backend& backend) const;
  // Translates a path for use with `backend`. Backends share the union's namespace, so this is
  // a copy.

  bool supportsModifications(kj::StringPtr path) const;
  // Whether the backend owning `path` accepts mutations there.

  kj::Maybe<kj::StringPtr> routePrefix(kj::StringPtr path) const;
  // The canonical prefix of the mount owning `path`, or null if the default backend owns it.

  // ---------------------------------------------------------------------------
  // Metadata

  kj::Maybe<kj::FsNode::Metadata> tryStat(kj::StringPtr path, bool followSymlinks = true) const;
  kj::FsNode::Metadata stat(kj::StringPtr path, bool followSymlinks = true) const;
  // Metadata from the owning backend. When following, links are followed only within that
  // backend: a link pointing into another backend has no metadata here. Use
  // resolveSymbolicLinks() first to follow such a link.

  bool exists(kj::StringPtr path, bool followSymlinks = true) const;
  bool isDirectory(kj::StringPtr path, bool followSymlinks = true) const;
  bool isFile(kj::StringPtr path, bool followSymlinks = true) const;
  bool isSymbolicLink(kj::StringPtr path) const;

  kj::String readSymbolicLink(kj::StringPtr path) const;
  // Raw link content. Throws NOT_FOUND if nothing is there.

  kj::Path resolveSymbolicLinks(kj::StringPtr path) const;
  // Returns the canonical path `path` names once every symlink along it has been replaced by its
  // target, wherever that target lives. Every component must exist. Throws NOT_FOUND for a
  // missing component and SYMLINK_LOOP when resolution does not terminate.

  kj::Array<kj::String> listDirectory(kj::StringPtr path) const;
  // Names in the directory as seen through the union: the owning backend's entries plus the
  // next component of every mount prefix below `path`. Sorted, without duplicates. A directory
  // that exists only because a mount lies below it lists just those mounts.

  kj::Maybe<kj::Array<kj::byte>> getXattr(kj::StringPtr path, kj::StringPtr name) const;

  // ---------------------------------------------------------------------------
  // Content

  kj::Own<kj::InputStream> openInputStream(kj::StringPtr path) const;
  kj::Own<kj::OutputStream> openOutputStream(kj::StringPtr path, bool append = false) const;

  // ---------------------------------------------------------------------------
  // Mutation
  //
  // Each of these throws PERMISSION_DENIED, before touching anything, when the backend that
  // would perform the change does not support modifications at the path.

  bool createDirectory(kj::StringPtr path) const;
  // Creates one directory. Returns false if it already exists. When `path` is itself a mount
  // prefix, the directory is created on the backend owning its parent, so that it shows up in
  // the parent's namespace.

  void createDirectoryAndParents(kj::StringPtr path) const;
  // Creates `path` and any missing ancestors, each routed on its own.

  void createSymbolicLink(kj::StringPtr linkPath, kj::StringPtr target) const;
  // `target` is stored as given; it need not exist.

  bool remove(kj::StringPtr path) const;
  // Removes a file, a symlink, or an empty directory. Returns false if nothing was there.

  void rename(kj::StringPtr fromPath, kj::StringPtr toPath) const;
  // Within one backend this is that backend's rename. Across backends, files and symlinks are
  // copied and then removed from the source; directories throw CROSS_DEVICE.

private:
  struct MountPoint {
    kj::Path prefix;
    kj::String key;
    kj::Own<const Backend> backend;
  };

  kj::Array<MountPoint> mounts;
  kj::HashMap<kj::StringPtr, size_t> index;
  // Maps MountPoint::key to its position in `mounts`.

  kj::Own<const Backend> defaultBackend;

  kj::Maybe<const MountPoint&> findMount(kj::PathPtr path) const;
  bool isMountPathOrAncestor(kj::PathPtr path) const;
  // True if `path` is a mount prefix or lies above one. Such a path is a directory of the union
  // even when the backend owning it has nothing there.

  const Backend& routeForCreation(kj::PathPtr path) const;
  void requireModifiable(const Backend& backend, kj::PathPtr path) const;
};

}  // namespace unionfs

UNIONFS_END_HEADER
