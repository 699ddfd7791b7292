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

#include "directory-backend.h"
#include "error.h"
#include "path.h"
#include <kj/debug.h>
#include <kj/refcount.h>
#include <sys/types.h>
#include <sys/xattr.h>
#include <errno.h>

namespace unionfs {

namespace {

kj::Maybe<kj::Array<kj::byte>> readXattr(int fd, kj::StringPtr name) {
  for (;;) {
    ssize_t size;
    KJ_SYSCALL_HANDLE_ERRORS(size = fgetxattr(fd, name.cStr(), nullptr, 0)) {
      case ENODATA:
      case ENOTSUP:
        return kj::none;
      default:
        KJ_FAIL_SYSCALL("fgetxattr(fd, name)", error, name);
    }

    auto result = kj::heapArray<kj::byte>(size);
    ssize_t n;
    KJ_SYSCALL_HANDLE_ERRORS(n = fgetxattr(fd, name.cStr(), result.begin(), result.size())) {
      case ERANGE:
        // The value grew since we asked for its size.
        continue;
      case ENODATA:
        // Removed in between.
        return kj::none;
      default:
        KJ_FAIL_SYSCALL("fgetxattr(fd, name)", error, name);
    }

    if (n < size) {
      return kj::heapArray<kj::byte>(result.slice(0, n));
    }
    return kj::mv(result);
  }
}

class DirectoryBackend final: public Backend, public kj::AtomicRefcounted {
public:
  DirectoryBackend(kj::Own<const kj::Directory> directory, BackendOptions options)
      : directory(kj::mv(directory)), root(kj::mv(options.root)),
        modificationPolicy(kj::mv(options.modificationPolicy)),
        xattrs(kj::mv(options.xattrs)) {}

  kj::Own<const Backend> clone() const override {
    return kj::atomicAddRef(*this);
  }

  kj::Maybe<kj::FsNode::Metadata> tryStat(kj::PathPtr path, bool followSymlinks) const override {
    if (followSymlinks) {
      KJ_IF_SOME(target, tryFollow(path)) {
        return tryLstatResolved(target);
      }
    } else {
      KJ_IF_SOME(resolved, tryResolveParent(path)) {
        return tryLstatResolved(resolved);
      }
    }
    return kj::none;
  }

  kj::Maybe<kj::Array<kj::String>> tryListNames(kj::PathPtr path) const override {
    KJ_IF_SOME(target, tryFollow(path)) {
      KJ_IF_SOME(meta, tryLstatResolved(target)) {
        if (meta.type == kj::FsNode::Type::DIRECTORY) {
          auto rel = relative(target);
          if (rel.size() == 0) {
            return directory->listNames();
          }
          return directory->openSubdir(rel)->listNames();
        }
      }
    }
    return kj::none;
  }

  bool tryCreateDirectory(kj::PathPtr path) const override {
    if (tryStat(path, false) != kj::none) {
      return false;
    }
    return directory->tryOpenSubdir(writablePath(path), kj::WriteMode::CREATE) != kj::none;
  }

  bool tryRemove(kj::PathPtr path) const override {
    KJ_IF_SOME(resolved, tryResolveParent(path)) {
      KJ_IF_SOME(meta, tryLstatResolved(resolved)) {
        KJ_REQUIRE(resolved != root, "can't remove the root of a backend",
                   toAbsoluteString(path));
        if (meta.type == kj::FsNode::Type::DIRECTORY) {
          // kj::Directory::remove() is recursive; only empty directories may go.
          KJ_REQUIRE(directory->openSubdir(relative(resolved))->listNames().size() == 0,
                     "directory not empty", toAbsoluteString(path));
        }
        return directory->tryRemove(relative(resolved));
      }
    }
    return false;
  }

  kj::Maybe<kj::Own<kj::InputStream>> tryOpenInputStream(kj::PathPtr path) const override {
    KJ_IF_SOME(target, tryFollow(path)) {
      KJ_IF_SOME(meta, tryLstatResolved(target)) {
        KJ_REQUIRE(meta.type == kj::FsNode::Type::FILE, "not a file", toAbsoluteString(path));
        auto file = directory->openFile(relative(target));
        auto stream = kj::heap<kj::FileInputStream>(*file);
        return kj::Own<kj::InputStream>(stream.attach(kj::mv(file)));
      }
    }
    return kj::none;
  }

  kj::Own<kj::OutputStream> openOutputStream(kj::PathPtr path, bool append) const override {
    auto rel = writablePath(path);
    KJ_IF_SOME(meta, directory->tryLstat(rel)) {
      if (meta.type == kj::FsNode::Type::SYMLINK) {
        // Write to the link's target, which must exist on this backend.
        KJ_IF_SOME(target, tryFollow(path)) {
          rel = relative(target).clone();
        } else {
          UNIONFS_FAIL(NOT_FOUND, "dangling symlink: ", toAbsoluteString(path));
        }
      }
    }
    KJ_IF_SOME(meta, directory->tryLstat(rel)) {
      KJ_REQUIRE(meta.type == kj::FsNode::Type::FILE, "not a file", toAbsoluteString(path));
    }

    auto mode = kj::WriteMode::CREATE | kj::WriteMode::MODIFY;
    if (append) {
      return directory->appendFile(rel, mode);
    } else {
      auto file = directory->openFile(rel, mode);
      file->truncate(0);
      auto stream = kj::heap<kj::FileOutputStream>(*file);
      return stream.attach(kj::mv(file));
    }
  }

  bool tryCreateSymlink(kj::PathPtr linkPath, kj::StringPtr target) const override {
    if (tryStat(linkPath, false) != kj::none) {
      return false;
    }
    return directory->trySymlink(writablePath(linkPath), target, kj::WriteMode::CREATE);
  }

  kj::Maybe<kj::String> tryReadlink(kj::PathPtr path) const override {
    KJ_IF_SOME(resolved, tryResolveParent(path)) {
      KJ_IF_SOME(meta, tryLstatResolved(resolved)) {
        if (meta.type == kj::FsNode::Type::SYMLINK) {
          return directory->tryReadlink(relative(resolved));
        }
      }
    }
    return kj::none;
  }

  bool tryRename(kj::PathPtr fromPath, kj::PathPtr toPath) const override {
    kj::Path from = nullptr;
    KJ_IF_SOME(resolved, tryResolveParent(fromPath)) {
      if (tryLstatResolved(resolved) == kj::none) {
        return false;
      }
      from = kj::mv(resolved);
    } else {
      return false;
    }
    KJ_REQUIRE(from != root, "can't rename the root of a backend", toAbsoluteString(fromPath));

    auto to = writablePath(toPath);
    auto fromRel = relative(from);
    if (to == fromRel) {
      return true;
    }
    KJ_REQUIRE(!to.startsWith(fromRel), "can't move a directory into itself",
               toAbsoluteString(fromPath), toAbsoluteString(toPath));
    KJ_IF_SOME(meta, directory->tryLstat(to)) {
      KJ_REQUIRE(meta.type != kj::FsNode::Type::DIRECTORY, "destination is a directory",
                 toAbsoluteString(toPath));
    }

    return directory->tryTransfer(to, kj::WriteMode::CREATE | kj::WriteMode::MODIFY,
                                  *directory, fromRel, kj::TransferMode::MOVE);
  }

  kj::Maybe<kj::Array<kj::byte>> getXattr(kj::PathPtr path, kj::StringPtr name) const override {
    KJ_IF_SOME(lookup, xattrs) {
      return lookup(path, name);
    }

    KJ_IF_SOME(target, tryFollow(path)) {
      KJ_IF_SOME(meta, tryLstatResolved(target)) {
        auto rel = relative(target);
        kj::Own<const kj::FsNode> node;
        if (rel.size() == 0) {
          node = directory->clone();
        } else if (meta.type == kj::FsNode::Type::DIRECTORY) {
          node = directory->openSubdir(rel);
        } else if (meta.type == kj::FsNode::Type::FILE) {
          node = directory->openFile(rel);
        } else {
          return kj::none;
        }

        KJ_IF_SOME(fd, node->getFd()) {
          return readXattr(fd, name);
        }
      }
    }
    return kj::none;
  }

  bool supportsModifications(kj::PathPtr path) const override {
    KJ_IF_SOME(policy, modificationPolicy) {
      return policy(path);
    }
    return true;
  }

private:
  kj::Own<const kj::Directory> directory;
  kj::Path root;
  kj::Maybe<ModificationPolicy> modificationPolicy;
  kj::Maybe<XattrLookup> xattrs;

  // A "resolved" path below is a union path inside `root` whose every component but the last
  // is a real directory on this backend. Only resolved paths are handed to `directory`, so KJ
  // never has to follow a symlink itself.

  kj::Maybe<kj::PathPtr> tryRelative(kj::PathPtr path) const {
    if (!path.startsWith(root)) {
      return kj::none;
    }
    return path.slice(root.size(), path.size());
  }

  kj::PathPtr relative(kj::PathPtr path) const {
    KJ_IF_SOME(rel, tryRelative(path)) {
      return rel;
    }
    UNIONFS_FAIL(NOT_FOUND, "outside of backend root ", toAbsoluteString(root), ": ",
                 toAbsoluteString(path));
  }

  kj::Maybe<kj::FsNode::Metadata> tryLstatResolved(kj::PathPtr path) const {
    auto rel = relative(path);
    if (rel.size() == 0) {
      return directory->stat();
    }
    return directory->tryLstat(rel);
  }

  kj::Maybe<kj::Path> tryFollow(kj::PathPtr path) const {
    // Resolves every symlink along `path`, including a trailing one, for as long as each target
    // stays inside this backend. Returns null if a target leaves the backend or a component
    // doesn't exist.

    if (!path.startsWith(root)) {
      return kj::none;
    }

    kj::Path current = path.clone();
    size_t done = root.size();
    uint hops = 0;

    while (done < current.size()) {
      auto prefix = current.slice(0, done + 1);
      KJ_IF_SOME(meta, tryLstatResolved(prefix)) {
        if (meta.type == kj::FsNode::Type::SYMLINK) {
          if (++hops > MAX_SYMLINK_HOPS) {
            UNIONFS_FAIL(SYMLINK_LOOP, "too many levels of symbolic links: ",
                         toAbsoluteString(path));
          }
          KJ_IF_SOME(content, directory->tryReadlink(relative(prefix))) {
            auto next = canonicalize(prefix.parent(), content)
                .append(current.slice(done + 1, current.size()));
            if (!next.startsWith(root)) {
              return kj::none;
            }
            done = kj::max(root.size(), commonPrefixLength(current.slice(0, done), next));
            current = kj::mv(next);
            continue;
          } else {
            // Replaced by something else since we looked.
            return kj::none;
          }
        } else if (meta.type != kj::FsNode::Type::DIRECTORY && done + 1 < current.size()) {
          return kj::none;
        }
      } else {
        return kj::none;
      }
      ++done;
    }

    return kj::mv(current);
  }

  kj::Maybe<kj::Path> tryResolveParent(kj::PathPtr path) const {
    // Like tryFollow() but leaves the last component alone. Null if the parent isn't a
    // directory on this backend.

    KJ_IF_SOME(rel, tryRelative(path)) {
      if (rel.size() == 0) {
        return path.clone();
      }
    } else {
      return kj::none;
    }

    KJ_IF_SOME(parent, tryFollow(path.parent())) {
      KJ_IF_SOME(meta, tryLstatResolved(parent)) {
        if (meta.type == kj::FsNode::Type::DIRECTORY) {
          return kj::mv(parent).append(path.basename());
        }
      }
    }
    return kj::none;
  }

  kj::Path writablePath(kj::PathPtr path) const {
    // The directory-relative path at which to create or replace `path`.

    KJ_IF_SOME(rel, tryRelative(path)) {
      KJ_REQUIRE(rel.size() > 0, "can't replace the root of a backend", toAbsoluteString(path));
    }
    KJ_IF_SOME(resolved, tryResolveParent(path)) {
      return relative(resolved).clone();
    }
    UNIONFS_FAIL(NOT_FOUND, "parent directory does not exist: ", toAbsoluteString(path));
  }
};

}  // namespace

kj::Own<const Backend> newDirectoryBackend(
    kj::Own<const kj::Directory> directory, BackendOptions options) {
  return kj::atomicRefcounted<DirectoryBackend>(kj::mv(directory), kj::mv(options));
}

kj::Own<const Backend> newInMemoryBackend(const kj::Clock& clock, BackendOptions options) {
  return newDirectoryBackend(kj::newInMemoryDirectory(clock), kj::mv(options));
}

}  // namespace unionfs
