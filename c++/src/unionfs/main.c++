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
#include "directory-backend.h"
#include "error.h"
#include "path.h"
#include <kj/main.h>
#include <kj/miniposix.h>
#include <kj/vector.h>

#ifndef VERSION
#define VERSION "(unknown)"
#endif

namespace unionfs {

static const char VERSION_STRING[] = "unionfs version " VERSION;

static kj::StringPtr typeName(kj::FsNode::Type type) {
  switch (type) {
    case kj::FsNode::Type::FILE: return "file";
    case kj::FsNode::Type::DIRECTORY: return "directory";
    case kj::FsNode::Type::SYMLINK: return "symlink";
    case kj::FsNode::Type::BLOCK_DEVICE: return "block device";
    case kj::FsNode::Type::CHARACTER_DEVICE: return "character device";
    case kj::FsNode::Type::NAMED_PIPE: return "named pipe";
    case kj::FsNode::Type::SOCKET: return "socket";
    case kj::FsNode::Type::OTHER: return "other";
  }
  return "unknown";
}

class UnionFsMain {
public:
  explicit UnionFsMain(kj::ProcessContext& context)
      : context(context), disk(kj::newDiskFilesystem()) {}

  kj::MainFunc getMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Presents several host directories as a single namespace and inspects it. Each "
          "--mount binds a host directory at a prefix of the namespace; everything no prefix "
          "matches is served from the --default directory, or the current directory if none "
          "is given.");
    builder.addSubCommand("ls", KJ_BIND_METHOD(*this, getLsMain),
                          "List directories.")
           .addSubCommand("cat", KJ_BIND_METHOD(*this, getCatMain),
                          "Write file contents to standard output.")
           .addSubCommand("stat", KJ_BIND_METHOD(*this, getStatMain),
                          "Show type, size and modification time.")
           .addSubCommand("readlink", KJ_BIND_METHOD(*this, getReadlinkMain),
                          "Print the content of symbolic links.")
           .addSubCommand("realpath", KJ_BIND_METHOD(*this, getRealpathMain),
                          "Resolve symbolic links, across mounts.")
           .addSubCommand("mkdir", KJ_BIND_METHOD(*this, getMkdirMain),
                          "Create directories.")
           .addSubCommand("route", KJ_BIND_METHOD(*this, getRouteMain),
                          "Show which mount owns each path.");
    addGlobalOptions(builder);
    return builder.build();
  }

  kj::MainFunc getLsMain() {
    return pathCommand("Lists the directories named by <path> as seen through the union.",
                       KJ_BIND_METHOD(*this, list));
  }

  kj::MainFunc getCatMain() {
    return pathCommand("Writes each file to standard output.", KJ_BIND_METHOD(*this, cat));
  }

  kj::MainFunc getStatMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Prints the metadata of each <path>. Symbolic links are followed only within the "
          "mount holding them.");
    addGlobalOptions(builder);
    builder.addOption({'L', "no-follow"}, KJ_BIND_METHOD(*this, setNoFollow),
                      "Describe symbolic links themselves rather than their targets.")
           .expectOneOrMoreArgs("<path>", KJ_BIND_METHOD(*this, stat));
    return builder.build();
  }

  kj::MainFunc getReadlinkMain() {
    return pathCommand("Prints the content of each symbolic link.",
                       KJ_BIND_METHOD(*this, readlink));
  }

  kj::MainFunc getRealpathMain() {
    return pathCommand("Prints the canonical path of each <path> with every symbolic link "
                       "resolved, following links from one mount into another.",
                       KJ_BIND_METHOD(*this, realpath));
  }

  kj::MainFunc getMkdirMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Creates directories. Creating a mount prefix creates it in the namespace of the "
          "mount above it.");
    addGlobalOptions(builder);
    builder.addOption({'p', "parents"}, KJ_BIND_METHOD(*this, setParents),
                      "Create missing parent directories too.")
           .expectOneOrMoreArgs("<path>", KJ_BIND_METHOD(*this, mkdir));
    return builder.build();
  }

  kj::MainFunc getRouteMain() {
    return pathCommand("Prints the mount prefix owning each <path>, or \"(default)\".",
                       KJ_BIND_METHOD(*this, route));
  }

  // =====================================================================================
  // shared options

  kj::MainBuilder::Validity addMount(kj::StringPtr spec) {
    KJ_IF_SOME(eq, spec.findFirst('=')) {
      auto prefix = kj::heapString(spec.slice(0, eq));
      if (!isAbsolute(prefix)) {
        return "mount prefix must be absolute";
      }
      mounts.add(MountSpec { kj::mv(prefix), kj::heapString(spec.slice(eq + 1)), false });
      return true;
    } else {
      return "expected <prefix>=<dir>";
    }
  }

  kj::MainBuilder::Validity addReadOnly(kj::StringPtr prefix) {
    auto canonical = canonicalize(prefix);
    for (auto& mount: mounts) {
      if (canonicalize(mount.prefix) == canonical) {
        mount.readOnly = true;
        return true;
      }
    }
    return "not a mount prefix (give --mount first)";
  }

  kj::MainBuilder::Validity setDefault(kj::StringPtr dir) {
    defaultDir = kj::heapString(dir);
    return true;
  }

  kj::MainBuilder::Validity setNoFollow() {
    followSymlinks = false;
    return true;
  }

  kj::MainBuilder::Validity setParents() {
    parents = true;
    return true;
  }

  // =====================================================================================
  // commands

  kj::MainBuilder::Validity list(kj::StringPtr path) {
    return forPath(path, [&](UnionFilesystem& fs) {
      for (auto& name: fs.listDirectory(path)) {
        writeLine(name);
      }
    });
  }

  kj::MainBuilder::Validity cat(kj::StringPtr path) {
    return forPath(path, [&](UnionFilesystem& fs) {
      auto content = fs.openInputStream(path)->readAllBytes();
      output.write(content.begin(), content.size());
    });
  }

  kj::MainBuilder::Validity stat(kj::StringPtr path) {
    return forPath(path, [&](UnionFilesystem& fs) {
      auto meta = fs.stat(path, followSymlinks);
      writeLine(kj::str(path, ": ", typeName(meta.type), ", ", meta.size, " bytes, modified ",
                        (meta.lastModified - kj::UNIX_EPOCH) / kj::SECONDS));
    });
  }

  kj::MainBuilder::Validity readlink(kj::StringPtr path) {
    return forPath(path, [&](UnionFilesystem& fs) {
      writeLine(fs.readSymbolicLink(path));
    });
  }

  kj::MainBuilder::Validity realpath(kj::StringPtr path) {
    return forPath(path, [&](UnionFilesystem& fs) {
      writeLine(toAbsoluteString(fs.resolveSymbolicLinks(path)));
    });
  }

  kj::MainBuilder::Validity mkdir(kj::StringPtr path) {
    return forPath(path, [&](UnionFilesystem& fs) {
      if (parents) {
        fs.createDirectoryAndParents(path);
      } else if (!fs.createDirectory(path)) {
        context.error(kj::str(path, ": already exists"));
      }
    });
  }

  kj::MainBuilder::Validity route(kj::StringPtr path) {
    return forPath(path, [&](UnionFilesystem& fs) {
      KJ_IF_SOME(prefix, fs.routePrefix(path)) {
        writeLine(kj::str(toAbsoluteString(canonicalize(path)), " -> ", prefix));
      } else {
        writeLine(kj::str(toAbsoluteString(canonicalize(path)), " -> (default)"));
      }
    });
  }

private:
  struct MountSpec {
    kj::String prefix;
    kj::String dir;
    bool readOnly;
  };

  kj::ProcessContext& context;
  kj::Own<kj::Filesystem> disk;
  kj::FdOutputStream output{STDOUT_FILENO};

  kj::Vector<MountSpec> mounts;
  kj::Maybe<kj::String> defaultDir;
  bool followSymlinks = true;
  bool parents = false;

  kj::Maybe<kj::Own<UnionFilesystem>> unionFs;

  void addGlobalOptions(kj::MainBuilder& builder) {
    builder.addOptionWithArg({'m', "mount"}, KJ_BIND_METHOD(*this, addMount), "<prefix>=<dir>",
                             "Serve the namespace under <prefix> from the host directory <dir>. "
                             "<dir> holds what appears under <prefix>. May be repeated; the "
                             "longest matching prefix wins.")
           .addOptionWithArg({'r', "read-only"}, KJ_BIND_METHOD(*this, addReadOnly), "<prefix>",
                             "Refuse modifications under the mount at <prefix>.")
           .addOptionWithArg({'d', "default"}, KJ_BIND_METHOD(*this, setDefault), "<dir>",
                             "Serve paths no mount matches from <dir>, which appears as the "
                             "root of the namespace.");
  }

  kj::MainFunc pathCommand(kj::StringPtr description,
                           kj::Function<kj::MainBuilder::Validity(kj::StringPtr)> handler) {
    kj::MainBuilder builder(context, VERSION_STRING, description);
    addGlobalOptions(builder);
    builder.expectOneOrMoreArgs("<path>", kj::mv(handler));
    return builder.build();
  }

  kj::Own<const kj::Directory> openHostDirectory(kj::StringPtr dir) {
    return disk->getRoot().openSubdir(disk->getCurrentPath().eval(dir));
  }

  UnionFilesystem& getUnionFs() {
    KJ_IF_SOME(fs, unionFs) {
      return *fs;
    }

    auto builder = kj::heapArrayBuilder<Mount>(mounts.size());
    for (auto& mount: mounts) {
      BackendOptions options;
      options.root = canonicalize(mount.prefix);
      if (mount.readOnly) {
        options.modificationPolicy = ModificationPolicy([](kj::PathPtr) { return false; });
      }
      builder.add(Mount {
        kj::heapString(mount.prefix),
        newDirectoryBackend(openHostDirectory(mount.dir), kj::mv(options))
      });
    }

    kj::Own<const kj::Directory> defaultRoot;
    KJ_IF_SOME(dir, defaultDir) {
      defaultRoot = openHostDirectory(dir);
    } else {
      defaultRoot = disk->getCurrent().clone();
    }

    auto fs = kj::heap<UnionFilesystem>(
        builder.finish(), newDirectoryBackend(kj::mv(defaultRoot)));
    auto& result = *fs;
    unionFs = kj::mv(fs);
    return result;
  }

  template <typename Func>
  kj::MainBuilder::Validity forPath(kj::StringPtr path, Func&& func) {
    // Runs `func` against the union. A failure is reported for this path alone so the remaining
    // paths still get processed; the process exit status records it.
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { func(getUnionFs()); })) {
      KJ_IF_SOME(kind, getErrorKind(exception)) {
        if (kind == ErrorKind::CONFIGURATION) {
          context.exitError(exception.getDescription());
        }
      }
      context.error(kj::str(path, ": ", exception.getDescription()));
    }
    return true;
  }

  void writeLine(kj::StringPtr text) {
    auto line = kj::str(text, '\n');
    output.write(line.begin(), line.size());
  }
};

}  // namespace unionfs

KJ_MAIN(unionfs::UnionFsMain);
