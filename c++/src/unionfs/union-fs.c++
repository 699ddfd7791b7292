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

#include "union-fs.h"
#include "error.h"
#include "path.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <algorithm>

namespace unionfs {

UnionFilesystem::UnionFilesystem(
    kj::Array<Mount> mountsParam, kj::Own<const Backend> defaultBackendParam)
    : defaultBackend(kj::mv(defaultBackendParam)) {
  if (defaultBackend == nullptr) {
    UNIONFS_FAIL(CONFIGURATION, "a default backend is required");
  }

  auto builder = kj::heapArrayBuilder<MountPoint>(mountsParam.size());
  for (auto& mount: mountsParam) {
    if (!isAbsolute(mount.prefix)) {
      UNIONFS_FAIL(CONFIGURATION, "mount prefix must be absolute: ", mount.prefix);
    }
    if (mount.backend == nullptr) {
      UNIONFS_FAIL(CONFIGURATION, "no backend given for mount prefix: ", mount.prefix);
    }
    auto prefix = canonicalize(mount.prefix);
    auto key = toAbsoluteString(prefix);
    builder.add(MountPoint { kj::mv(prefix), kj::mv(key), kj::mv(mount.backend) });
  }
  mounts = builder.finish();

  for (auto i: kj::indices(mounts)) {
    auto& mount = mounts[i];
    bool duplicate = false;
    index.upsert(mount.key.asPtr(), i, [&](size_t&, size_t&&) { duplicate = true; });
    if (duplicate) {
      UNIONFS_FAIL(CONFIGURATION, "prefix mounted more than once: ", mount.key);
    }
  }
}

kj::Maybe<const UnionFilesystem::MountPoint&> UnionFilesystem::findMount(kj::PathPtr path) const {
  // Try the path itself, then each ancestor up to the root. The first hit is the longest prefix.
  for (size_t n = path.size();; n--) {
    auto key = toAbsoluteString(path.slice(0, n));
    KJ_IF_SOME(i, index.find(key.asPtr())) {
      return mounts[i];
    }
    if (n == 0) break;
  }
  return kj::none;
}

bool UnionFilesystem::isMountPathOrAncestor(kj::PathPtr path) const {
  for (auto& mount: mounts) {
    if (mount.prefix.startsWith(path)) return true;
  }
  return false;
}

const Backend& UnionFilesystem::route(kj::PathPtr path) const {
  KJ_IF_SOME(mount, findMount(path)) {
    return *mount.backend;
  }
  return *defaultBackend;
}

const Backend& UnionFilesystem::route(kj::StringPtr path) const {
  return route(canonicalize(path));
}

kj::Maybe<kj::StringPtr> UnionFilesystem::routePrefix(kj::StringPtr path) const {
  KJ_IF_SOME(mount, findMount(canonicalize(path))) {
    return mount.key.asPtr();
  }
  return kj::none;
}

kj::Path UnionFilesystem::adjustPath(kj::PathPtr path, const Backend&) const {
  return path.clone();
}

const Backend& UnionFilesystem::routeForCreation(kj::PathPtr path) const {
  // A mount's root belongs to the namespace of its parent. Creating it there is what makes the
  // mount point visible to anyone listing the parent through its own backend.
  KJ_IF_SOME(mount, findMount(path)) {
    if (path.size() > 0 && mount.prefix == path) {
      KJ_LOG(INFO, "creating mount root on the backend owning its parent", mount.key);
      return route(path.parent());
    }
    return *mount.backend;
  }
  return *defaultBackend;
}

void UnionFilesystem::requireModifiable(const Backend& backend, kj::PathPtr path) const {
  if (!backend.supportsModifications(path)) {
    UNIONFS_FAIL(PERMISSION_DENIED, "modification not supported: ", toAbsoluteString(path));
  }
}

bool UnionFilesystem::supportsModifications(kj::StringPtr path) const {
  auto canonical = canonicalize(path);
  return route(canonical).supportsModifications(canonical);
}

// =======================================================================================
// Metadata

kj::Maybe<kj::FsNode::Metadata> UnionFilesystem::tryStat(
    kj::StringPtr path, bool followSymlinks) const {
  auto canonical = canonicalize(path);
  return route(canonical).tryStat(canonical, followSymlinks);
}

kj::FsNode::Metadata UnionFilesystem::stat(kj::StringPtr path, bool followSymlinks) const {
  auto canonical = canonicalize(path);
  return route(canonical).stat(canonical, followSymlinks);
}

bool UnionFilesystem::exists(kj::StringPtr path, bool followSymlinks) const {
  return tryStat(path, followSymlinks) != kj::none;
}

bool UnionFilesystem::isDirectory(kj::StringPtr path, bool followSymlinks) const {
  KJ_IF_SOME(meta, tryStat(path, followSymlinks)) {
    return meta.type == kj::FsNode::Type::DIRECTORY;
  }
  return false;
}

bool UnionFilesystem::isFile(kj::StringPtr path, bool followSymlinks) const {
  KJ_IF_SOME(meta, tryStat(path, followSymlinks)) {
    return meta.type == kj::FsNode::Type::FILE;
  }
  return false;
}

bool UnionFilesystem::isSymbolicLink(kj::StringPtr path) const {
  KJ_IF_SOME(meta, tryStat(path, false)) {
    return meta.type == kj::FsNode::Type::SYMLINK;
  }
  return false;
}

kj::String UnionFilesystem::readSymbolicLink(kj::StringPtr path) const {
  auto canonical = canonicalize(path);
  auto& backend = route(canonical);
  auto meta = backend.stat(canonical, false);
  KJ_REQUIRE(meta.type == kj::FsNode::Type::SYMLINK, "not a symbolic link", path);
  return backend.readlink(canonical);
}

kj::Path UnionFilesystem::resolveSymbolicLinks(kj::StringPtr path) const {
  kj::Path current = canonicalize(path);

  // The first `done` components of `current` are known to be directories, not links.
  size_t done = 0;
  uint hops = 0;
  kj::HashSet<kj::String> seen;

  while (done < current.size()) {
    auto prefix = current.slice(0, done + 1);
    auto& backend = route(prefix);

    KJ_IF_SOME(meta, backend.tryStat(prefix, false)) {
      switch (meta.type) {
        case kj::FsNode::Type::SYMLINK: {
          auto state = kj::str(done, ':', toAbsoluteString(current));
          if (seen.contains(state) || ++hops > MAX_SYMLINK_HOPS) {
            UNIONFS_FAIL(SYMLINK_LOOP, "too many levels of symbolic links: ", path);
          }
          seen.insert(kj::mv(state));

          // A relative target is taken from the directory holding the link, and whatever
          // followed the link in `current` is appended. The result may route anywhere.
          auto target = canonicalize(prefix.parent(), backend.readlink(prefix));
          auto next = kj::mv(target).append(current.slice(done + 1, current.size()));
          done = commonPrefixLength(current.slice(0, done), next);
          current = kj::mv(next);
          continue;
        }
        case kj::FsNode::Type::DIRECTORY:
          break;
        default:
          if (done + 1 < current.size()) {
            UNIONFS_FAIL(NOT_FOUND, "not a directory: ", toAbsoluteString(prefix),
                         " (resolving ", path, ")");
          }
          break;
      }
    } else if (!isMountPathOrAncestor(prefix)) {
      UNIONFS_FAIL(NOT_FOUND, "no such file or directory: ", toAbsoluteString(prefix),
                   " (resolving ", path, ")");
    }

    ++done;
  }

  return kj::mv(current);
}

kj::Array<kj::String> UnionFilesystem::listDirectory(kj::StringPtr path) const {
  auto canonical = canonicalize(path);
  auto& backend = route(canonical);
  kj::Array<kj::String> names;
  KJ_IF_SOME(found, backend.tryListNames(canonical)) {
    names = kj::mv(found);
  } else if (isMountPathOrAncestor(canonical)) {
    names = kj::heapArray<kj::String>(0);
  } else {
    names = backend.listNames(canonical);
  }

  kj::Vector<kj::String> result(names.size() + mounts.size());
  for (auto& name: names) {
    result.add(kj::mv(name));
  }
  for (auto& mount: mounts) {
    // A deeper mount contributes the ancestor through which it is reached.
    if (mount.prefix.size() > canonical.size() && mount.prefix.startsWith(canonical)) {
      result.add(kj::str(mount.prefix[canonical.size()]));
    }
  }

  std::sort(result.begin(), result.end());
  auto end = std::unique(result.begin(), result.end());
  result.truncate(end - result.begin());
  return result.releaseAsArray();
}

kj::Maybe<kj::Array<kj::byte>> UnionFilesystem::getXattr(
    kj::StringPtr path, kj::StringPtr name) const {
  auto canonical = canonicalize(path);
  return route(canonical).getXattr(canonical, name);
}

// =======================================================================================
// Content

kj::Own<kj::InputStream> UnionFilesystem::openInputStream(kj::StringPtr path) const {
  auto canonical = canonicalize(path);
  return route(canonical).openInputStream(canonical);
}

kj::Own<kj::OutputStream> UnionFilesystem::openOutputStream(
    kj::StringPtr path, bool append) const {
  auto canonical = canonicalize(path);
  auto& backend = route(canonical);
  requireModifiable(backend, canonical);
  return backend.openOutputStream(canonical, append);
}

// =======================================================================================
// Mutation

bool UnionFilesystem::createDirectory(kj::StringPtr path) const {
  auto canonical = canonicalize(path);
  auto& backend = routeForCreation(canonical);
  requireModifiable(backend, canonical);
  return backend.tryCreateDirectory(canonical);
}

void UnionFilesystem::createDirectoryAndParents(kj::StringPtr path) const {
  auto canonical = canonicalize(path);

  for (size_t n = 1; n <= canonical.size(); n++) {
    auto ancestor = canonical.slice(0, n);
    KJ_IF_SOME(meta, route(ancestor).tryStat(ancestor, true)) {
      KJ_REQUIRE(meta.type == kj::FsNode::Type::DIRECTORY, "not a directory",
                 toAbsoluteString(ancestor));
      continue;
    }

    auto& backend = routeForCreation(ancestor);
    requireModifiable(backend, ancestor);
    backend.tryCreateDirectory(ancestor);
  }
}

void UnionFilesystem::createSymbolicLink(kj::StringPtr linkPath, kj::StringPtr target) const {
  auto canonical = canonicalize(linkPath);
  auto& backend = route(canonical);
  requireModifiable(backend, canonical);
  if (!backend.tryCreateSymlink(canonical, target)) {
    KJ_FAIL_REQUIRE("path already exists", linkPath);
  }
}

bool UnionFilesystem::remove(kj::StringPtr path) const {
  auto canonical = canonicalize(path);
  auto& backend = route(canonical);
  requireModifiable(backend, canonical);
  return backend.tryRemove(canonical);
}

void UnionFilesystem::rename(kj::StringPtr fromPath, kj::StringPtr toPath) const {
  auto from = canonicalize(fromPath);
  auto to = canonicalize(toPath);
  auto& fromBackend = route(from);
  auto& toBackend = route(to);
  requireModifiable(fromBackend, from);
  requireModifiable(toBackend, to);

  if (&fromBackend == &toBackend) {
    if (!fromBackend.tryRename(from, to)) {
      UNIONFS_FAIL(NOT_FOUND, "no such file or directory: ", fromPath);
    }
    return;
  }

  auto meta = fromBackend.stat(from, false);
  if (meta.type == kj::FsNode::Type::DIRECTORY) {
    UNIONFS_FAIL(CROSS_DEVICE, "can't move a directory to another backend: ",
                 fromPath, " -> ", toPath);
  }

  KJ_LOG(INFO, "renaming across backends by copying", fromPath, toPath);

  KJ_IF_SOME(existing, toBackend.tryStat(to, false)) {
    KJ_REQUIRE(existing.type != kj::FsNode::Type::DIRECTORY, "destination is a directory",
               toPath);
    toBackend.tryRemove(to);
  }

  switch (meta.type) {
    case kj::FsNode::Type::FILE: {
      auto content = fromBackend.openInputStream(from)->readAllBytes();
      toBackend.openOutputStream(to, false)->write(content.begin(), content.size());
      break;
    }
    case kj::FsNode::Type::SYMLINK:
      if (!toBackend.tryCreateSymlink(to, fromBackend.readlink(from))) {
        KJ_FAIL_REQUIRE("path already exists", toPath);
      }
      break;
    default:
      KJ_FAIL_REQUIRE("can't move a special file to another backend", fromPath);
  }

  fromBackend.tryRemove(from);
}

}  // namespace unionfs
