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
#include "test-util.h"
#include <kj/vector.h>
#include <string.h>

namespace unionfs {
namespace _ {  // private
namespace {

kj::Own<const Backend> newBackendAt(const kj::Clock& clock, kj::StringPtr root) {
  BackendOptions options;
  options.root = canonicalize(root);
  return newInMemoryBackend(clock, kj::mv(options));
}

kj::Own<const Backend> newBackendWithPolicy(const kj::Clock& clock, bool writable) {
  BackendOptions options;
  options.modificationPolicy = ModificationPolicy([writable](kj::PathPtr) {
    return writable;
  });
  return newInMemoryBackend(clock, kj::mv(options));
}

bool contains(kj::ArrayPtr<const kj::String> names, kj::StringPtr name) {
  for (auto& n: names) {
    if (n == name) return true;
  }
  return false;
}

KJ_TEST("paths are routed to the longest matching prefix") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto foo = newBackendAt(clock, "/foo");
  auto bar = newBackendAt(clock, "/foo/bar");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/foo"), foo->clone() });
  mounts.add(Mount { kj::str("/foo/bar"), bar->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  KJ_EXPECT(&fs.route("/") == def.get());
  KJ_EXPECT(&fs.route("/other") == def.get());
  KJ_EXPECT(&fs.route("/fooz") == def.get());
  KJ_EXPECT(&fs.route("/foo") == foo.get());
  KJ_EXPECT(&fs.route("/foo/x") == foo.get());
  KJ_EXPECT(&fs.route("/foo/x/y/z") == foo.get());
  KJ_EXPECT(&fs.route("/foo/bar") == bar.get());
  KJ_EXPECT(&fs.route("/foo/bar/x") == bar.get());
  KJ_EXPECT(&fs.route(canonicalize("/foo/bar/x")) == bar.get());

  // Canonicalization happens before routing.
  KJ_EXPECT(&fs.route("/foo/bar/../x") == &fs.route("/foo/x"));
  KJ_EXPECT(&fs.route("/foo/bar/../x") == foo.get());
  KJ_EXPECT(&fs.route("/foo/bar/../..") == def.get());
  KJ_EXPECT(&fs.route("/foo/./bar//") == bar.get());
  KJ_EXPECT(&fs.route("/../../foo/bar") == bar.get());

  KJ_IF_SOME(prefix, fs.routePrefix("/foo/bar/baz")) {
    KJ_EXPECT(prefix == "/foo/bar");
  } else {
    KJ_FAIL_EXPECT("no mount found");
  }
  KJ_EXPECT(fs.routePrefix("/elsewhere") == kj::none);
}

KJ_TEST("route /in and /out") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto in = newBackendAt(clock, "/in");
  auto out = newBackendAt(clock, "/out");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/in"), in->clone() });
  mounts.add(Mount { kj::str("/out"), out->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  KJ_EXPECT(&fs.route("/out/../in") == in.get());
  KJ_EXPECT(&fs.route("/in/../out/x") == out.get());
  KJ_EXPECT(&fs.route("/in/..") == def.get());
}

KJ_TEST("construction requires a default backend") {
  TestClock clock;

  expectErrorKind(ErrorKind::CONFIGURATION, [&]() {
    UnionFilesystem fs(nullptr, nullptr);
  });

  expectErrorKind(ErrorKind::CONFIGURATION, [&]() {
    kj::Vector<Mount> mounts;
    mounts.add(Mount { kj::str("/in"), newInMemoryBackend(clock) });
    UnionFilesystem fs(mounts.releaseAsArray(), nullptr);
  });

  // An empty table is fine.
  UnionFilesystem fs(nullptr, newInMemoryBackend(clock));
  KJ_EXPECT(fs.isDirectory("/"));
}

KJ_TEST("construction rejects a bad mount table") {
  TestClock clock;

  expectErrorKind(ErrorKind::CONFIGURATION, [&]() {
    kj::Vector<Mount> mounts;
    mounts.add(Mount { kj::str("relative"), newInMemoryBackend(clock) });
    UnionFilesystem fs(mounts.releaseAsArray(), newInMemoryBackend(clock));
  });

  expectErrorKind(ErrorKind::CONFIGURATION, [&]() {
    kj::Vector<Mount> mounts;
    mounts.add(Mount { kj::str("/out"), nullptr });
    UnionFilesystem fs(mounts.releaseAsArray(), newInMemoryBackend(clock));
  });

  expectErrorKind(ErrorKind::CONFIGURATION, [&]() {
    kj::Vector<Mount> mounts;
    mounts.add(Mount { kj::str("/out"), newInMemoryBackend(clock) });
    mounts.add(Mount { kj::str("/out/"), newInMemoryBackend(clock) });
    UnionFilesystem fs(mounts.releaseAsArray(), newInMemoryBackend(clock));
  });

  // A trailing separator alone is just another spelling.
  kj::Vector<Mount> mounts;
  auto out = newBackendAt(clock, "/out");
  mounts.add(Mount { kj::str("/out/"), out->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), newInMemoryBackend(clock));
  KJ_EXPECT(&fs.route("/out/x") == out.get());
}

KJ_TEST("basic delegation") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto foo = newBackendAt(clock, "/foo");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/foo"), foo->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  KJ_EXPECT(fs.createDirectory("/bar"));
  KJ_EXPECT(!fs.createDirectory("/bar"));
  KJ_EXPECT(fs.createDirectory("/foo/baz"));

  KJ_EXPECT(def->tryStat(canonicalize("/bar"), true) != kj::none);
  KJ_EXPECT(foo->tryStat(canonicalize("/bar"), true) == kj::none);
  KJ_EXPECT(foo->tryStat(canonicalize("/foo/baz"), true) != kj::none);
  KJ_EXPECT(def->tryStat(canonicalize("/foo/baz"), true) == kj::none);

  writeFile(fs, "/foo/baz/file", "contents");
  KJ_EXPECT(readFile(fs, "/foo/baz/file") == "contents");
  KJ_EXPECT(readFile(*foo, "/foo/baz/file") == "contents");
  KJ_EXPECT(fs.isFile("/foo/baz/file"));
  KJ_EXPECT(fs.stat("/foo/baz/file").size == 8);
  KJ_EXPECT(!fs.exists("/foo/baz/nope"));
  KJ_EXPECT(!fs.isDirectory("/foo/baz/file"));

  writeFile(fs, "/foo/baz/file", "new");
  KJ_EXPECT(readFile(fs, "/foo/baz/file") == "new");
  fs.openOutputStream("/foo/baz/file", true)->write("er", 2);
  KJ_EXPECT(readFile(fs, "/foo/baz/file") == "newer");

  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.stat("/nothing"); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.openInputStream("/foo/nothing"); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.createDirectory("/missing/child"); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.listDirectory("/missing"); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.listDirectory("/foo/baz/file"); });

  KJ_EXPECT(fs.remove("/foo/baz/file"));
  KJ_EXPECT(!fs.remove("/foo/baz/file"));
  KJ_EXPECT(!fs.exists("/foo/baz/file"));
}

KJ_TEST("backend errors propagate unchanged") {
  TestClock clock;
  UnionFilesystem fs(nullptr, newInMemoryBackend(clock));

  fs.createDirectory("/dir");
  writeFile(fs, "/dir/file", "x");

  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { fs.remove("/dir"); })) {
    KJ_EXPECT(getErrorKind(exception) == kj::none);
    KJ_EXPECT(strstr(exception.getDescription().cStr(), "directory not empty") != nullptr,
              exception.getDescription());
  } else {
    KJ_FAIL_EXPECT("removing a non-empty directory should fail");
  }
  KJ_EXPECT(fs.exists("/dir/file"));
}

KJ_TEST("creating a mount root creates it in the parent's namespace") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto foo = newBackendAt(clock, "/foo");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/foo"), foo->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  KJ_EXPECT(fs.createDirectory("/foo"));

  auto rootNames = def->listNames(canonicalize("/"));
  KJ_ASSERT(rootNames.size() == 1);
  KJ_EXPECT(rootNames[0] == "foo");

  // The mount's own root is untouched.
  KJ_EXPECT(foo->listNames(canonicalize("/foo")).size() == 0);
  KJ_EXPECT(fs.listDirectory("/foo").size() == 0);
  KJ_EXPECT(fs.isDirectory("/foo"));

  // Creating it again finds it on the parent's backend.
  KJ_EXPECT(!fs.createDirectory("/foo"));
  KJ_EXPECT(!fs.createDirectory("/foo/"));
  KJ_EXPECT(!fs.createDirectory("/"));
}

KJ_TEST("creating a nested mount root lands on the enclosing mount") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto out = newBackendAt(clock, "/out");
  auto deep = newBackendAt(clock, "/out/dir");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/out"), out->clone() });
  mounts.add(Mount { kj::str("/out/dir"), deep->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  KJ_EXPECT(fs.createDirectory("/out/dir"));

  auto names = out->listNames(canonicalize("/out"));
  KJ_ASSERT(names.size() == 1);
  KJ_EXPECT(names[0] == "dir");
  KJ_EXPECT(deep->listNames(canonicalize("/out/dir")).size() == 0);
  KJ_EXPECT(def->listNames(canonicalize("/")).size() == 0);
}

KJ_TEST("listing includes mount points below the directory") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto out = newBackendAt(clock, "/out");
  auto deep = newBackendAt(clock, "/out/dir");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/out"), out->clone() });
  mounts.add(Mount { kj::str("/out/dir"), deep->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  fs.createDirectory("/zzz");
  fs.createDirectory("/aaa");

  // "/out" shows up whether or not anyone created it on the default backend.
  {
    auto names = fs.listDirectory("/");
    KJ_ASSERT(names.size() == 3, names.size());
    KJ_EXPECT(names[0] == "aaa");
    KJ_EXPECT(names[1] == "out");
    KJ_EXPECT(names[2] == "zzz");
  }

  fs.createDirectory("/out");
  KJ_EXPECT(fs.listDirectory("/").size() == 3);

  writeFile(fs, "/out/file", "x");
  {
    auto names = fs.listDirectory("/out");
    KJ_ASSERT(names.size() == 2);
    KJ_EXPECT(names[0] == "dir");
    KJ_EXPECT(names[1] == "file");
  }

  KJ_EXPECT(fs.listDirectory("/out/dir").size() == 0);
  KJ_EXPECT(fs.listDirectory("/out/dir/.").size() == 0);
}

KJ_TEST("supportsModifications is forwarded") {
  TestClock clock;
  auto def = newBackendWithPolicy(clock, true);
  auto frozen = newBackendWithPolicy(clock, false);

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/frozen"), frozen->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  for (auto path: {"/", "/a", "/a/b", "/frozen", "/frozen/x", "/frozen/../x"}) {
    auto canonical = canonicalize(path);
    KJ_EXPECT(fs.supportsModifications(path) ==
              fs.route(canonical).supportsModifications(canonical), path);
  }
  KJ_EXPECT(fs.supportsModifications("/a"));
  KJ_EXPECT(!fs.supportsModifications("/frozen/x"));
}

KJ_TEST("mutations on a read-only mount are refused without side effects") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);

  BackendOptions options;
  options.root = canonicalize("/ro");
  bool writable = true;
  options.modificationPolicy = ModificationPolicy([&writable](kj::PathPtr) {
    return writable;
  });
  auto ro = newInMemoryBackend(clock, kj::mv(options));

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/ro"), ro->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  fs.createDirectory("/ro/dir");
  writeFile(fs, "/ro/file", "original");
  writeFile(fs, "/scratch", "scratch");
  writable = false;

  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() { fs.createDirectory("/ro/new"); });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() {
    fs.createDirectoryAndParents("/ro/a/b");
  });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() { writeFile(fs, "/ro/file", "changed"); });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() { writeFile(fs, "/ro/other", "new"); });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() {
    fs.createSymbolicLink("/ro/link", "file");
  });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() { fs.remove("/ro/file"); });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() { fs.rename("/ro/file", "/ro/moved"); });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() { fs.rename("/ro/file", "/elsewhere"); });
  expectErrorKind(ErrorKind::PERMISSION_DENIED, [&]() { fs.rename("/scratch", "/ro/scratch"); });

  KJ_EXPECT(readFile(fs, "/ro/file") == "original");
  KJ_EXPECT(readFile(fs, "/scratch") == "scratch");
  KJ_EXPECT(!fs.exists("/ro/new"));
  KJ_EXPECT(!fs.exists("/ro/a"));
  KJ_EXPECT(!fs.exists("/ro/other"));
  KJ_EXPECT(!fs.exists("/ro/link", false));
  KJ_EXPECT(!fs.exists("/ro/moved"));
  KJ_EXPECT(!fs.exists("/ro/scratch"));
  KJ_EXPECT(!fs.exists("/elsewhere"));

  // Reading is still fine.
  KJ_EXPECT(fs.listDirectory("/ro").size() == 2);
}

KJ_TEST("write through /out lands on its backend") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto in = newBackendAt(clock, "/in");
  auto out = newBackendAt(clock, "/out");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/in"), in->clone() });
  mounts.add(Mount { kj::str("/out"), out->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  KJ_EXPECT(fs.createDirectory("/out"));
  KJ_EXPECT(contains(def->listNames(canonicalize("/")), "out"));

  writeFile(fs, "/out/in", "data");

  auto names = fs.listDirectory("/out");
  KJ_ASSERT(names.size() == 1);
  KJ_EXPECT(names[0] == "in");

  KJ_EXPECT(readFile(*out, "/out/in") == "data");
  KJ_EXPECT(in->listNames(canonicalize("/in")).size() == 0);
  KJ_EXPECT(def->listNames(canonicalize("/out")).size() == 0);
}

KJ_TEST("ascending past nested mounts") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto foo = newBackendAt(clock, "/foo");
  auto bar = newBackendAt(clock, "/foo/bar");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/foo"), foo->clone() });
  mounts.add(Mount { kj::str("/foo/bar"), bar->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  KJ_EXPECT(&fs.route("/foo/bar/../..") == def.get());

  writeFile(fs, "/top", "default");
  writeFile(fs, "/foo/bar/leaf", "bar");
  KJ_EXPECT(readFile(fs, "/foo/bar/../../top") == "default");
  KJ_EXPECT(readFile(fs, "/foo/bar/../bar/leaf") == "bar");
  KJ_EXPECT(readFile(*bar, "/foo/bar/leaf") == "bar");
}

KJ_TEST("explicit cross-backend symlink resolution") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto in = newInMemoryBackend(clock);
  auto out = newBackendAt(clock, "/out");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/in"), in->clone() });
  mounts.add(Mount { kj::str("/out"), out->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  // Populate /in directly, bypassing the union.
  KJ_EXPECT(in->tryCreateDirectory(canonicalize("/in")));
  in->openOutputStream(canonicalize("/in/bar.txt"), false)->write("i", 1);

  fs.createSymbolicLink("/out/foo", "../in/bar.txt");

  KJ_EXPECT(fs.stat("/out/foo", false).type == kj::FsNode::Type::SYMLINK);
  KJ_EXPECT(fs.isSymbolicLink("/out/foo"));
  KJ_EXPECT(fs.readSymbolicLink("/out/foo") == "../in/bar.txt");

  // /out's backend can't follow a link into /in by itself.
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.stat("/out/foo", true); });
  KJ_EXPECT(!fs.exists("/out/foo"));
  KJ_EXPECT(fs.exists("/out/foo", false));

  auto resolved = fs.resolveSymbolicLinks("/out/foo");
  KJ_EXPECT(toAbsoluteString(resolved) == "/in/bar.txt");
  KJ_EXPECT(readFile(fs, toAbsoluteString(resolved)) == "i");
  KJ_EXPECT(&fs.route(resolved) == in.get());
  KJ_EXPECT(fs.adjustPath(resolved, fs.route(resolved)) == resolved);
}

KJ_TEST("resolveSymbolicLinks through directories on other backends") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto in = newBackendAt(clock, "/in");
  auto out = newBackendAt(clock, "/out");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/in"), in->clone() });
  mounts.add(Mount { kj::str("/out"), out->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  fs.createDirectoryAndParents("/in/real/sub");
  writeFile(fs, "/in/real/sub/file", "deep");
  fs.createSymbolicLink("/out/dirlink", "/in/real");
  fs.createSymbolicLink("/in/real/back", "../../out/dirlink/sub");
  fs.createSymbolicLink("/top", "out/dirlink");

  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/out/dirlink/sub/file")) ==
            "/in/real/sub/file");
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/top/back/file")) ==
            "/in/real/sub/file");
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/out/./dirlink/../dirlink")) ==
            "/in/real");
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/in/real/sub")) == "/in/real/sub");
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/")) == "/");

  expectErrorKind(ErrorKind::NOT_FOUND, [&]() {
    fs.resolveSymbolicLinks("/out/dirlink/missing");
  });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() {
    fs.resolveSymbolicLinks("/in/real/sub/file/beyond");
  });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.resolveSymbolicLinks("/nowhere"); });
}

KJ_TEST("ancestors of a nested mount need not exist on their backend") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto b = newBackendAt(clock, "/a/b");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/a/b"), b->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  writeFile(fs, "/a/b/f", "x");
  KJ_EXPECT(fs.stat("/a/b/f").type == kj::FsNode::Type::FILE);
  KJ_EXPECT(def->tryStat(canonicalize("/a"), false) == kj::none);

  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/a/b/f")) == "/a/b/f");
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/a/b")) == "/a/b");
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/a")) == "/a");

  {
    auto names = fs.listDirectory("/a");
    KJ_ASSERT(names.size() == 1);
    KJ_EXPECT(names[0] == "b");
  }
  {
    auto names = fs.listDirectory("/");
    KJ_ASSERT(names.size() == 1);
    KJ_EXPECT(names[0] == "a");
  }

  // A link through the synthesized ancestor reaches the mount.
  fs.createSymbolicLink("/link", "a/b/f");
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks("/link")) == "/a/b/f");

  // Siblings of the mount are still missing.
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.resolveSymbolicLinks("/a/c"); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.listDirectory("/a/c"); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.listDirectory("/x"); });
}

KJ_TEST("symlink loops are detected") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto a = newBackendAt(clock, "/a");
  auto b = newBackendAt(clock, "/b");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/a"), a->clone() });
  mounts.add(Mount { kj::str("/b"), b->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  fs.createSymbolicLink("/a/link", "/b/link");
  fs.createSymbolicLink("/b/link", "../a/link");
  fs.createSymbolicLink("/self", "self");

  expectErrorKind(ErrorKind::SYMLINK_LOOP, [&]() { fs.resolveSymbolicLinks("/a/link"); });
  expectErrorKind(ErrorKind::SYMLINK_LOOP, [&]() { fs.resolveSymbolicLinks("/b/link/x"); });
  expectErrorKind(ErrorKind::SYMLINK_LOOP, [&]() { fs.resolveSymbolicLinks("/self"); });

  // A long chain that does terminate is fine, up to the hop limit.
  fs.createDirectory("/chain");
  writeFile(fs, "/chain/end", "done");
  kj::String previous = kj::str("end");
  for (uint i = 0; i < MAX_SYMLINK_HOPS; i++) {
    auto name = kj::str("l", i);
    fs.createSymbolicLink(kj::str("/chain/", name), previous);
    previous = kj::mv(name);
  }
  KJ_EXPECT(toAbsoluteString(fs.resolveSymbolicLinks(kj::str("/chain/", previous))) ==
            "/chain/end");

  fs.createSymbolicLink("/chain/toolong", previous);
  expectErrorKind(ErrorKind::SYMLINK_LOOP, [&]() { fs.resolveSymbolicLinks("/chain/toolong"); });
}

KJ_TEST("create parents across a mapping") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto dir = newBackendAt(clock, "/out/dir");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/out/dir"), dir->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  fs.createDirectoryAndParents("/out/dir/biz/bang");
  KJ_EXPECT(fs.isDirectory("/out/dir/biz/bang"));
  KJ_EXPECT(dir->stat(canonicalize("/out/dir/biz/bang"), true).type ==
            kj::FsNode::Type::DIRECTORY);
  KJ_EXPECT(def->stat(canonicalize("/out"), true).type == kj::FsNode::Type::DIRECTORY);
  KJ_EXPECT(def->tryStat(canonicalize("/out/dir/biz"), true) == kj::none);

  // Again, with everything already there.
  fs.createDirectoryAndParents("/out/dir/biz/bang");

  writeFile(fs, "/out/file", "x");
  KJ_EXPECT_THROW_MESSAGE("not a directory", fs.createDirectoryAndParents("/out/file/sub"));
}

KJ_TEST("rename within and across backends") {
  TestClock clock;
  auto def = newInMemoryBackend(clock);
  auto out = newBackendAt(clock, "/out");

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/out"), out->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), def->clone());

  writeFile(fs, "/out/a", "alpha");
  fs.rename("/out/a", "/out/b");
  KJ_EXPECT(!fs.exists("/out/a"));
  KJ_EXPECT(readFile(fs, "/out/b") == "alpha");

  // A file is copied to the other backend, then removed.
  fs.rename("/out/b", "/moved");
  KJ_EXPECT(!fs.exists("/out/b"));
  KJ_EXPECT(readFile(*def, "/moved") == "alpha");

  // So is a symlink, whose content is kept as is.
  fs.createSymbolicLink("/out/link", "../moved");
  fs.rename("/out/link", "/link");
  KJ_EXPECT(!fs.exists("/out/link", false));
  KJ_EXPECT(fs.readSymbolicLink("/link") == "../moved");

  // An existing file at the destination is replaced.
  writeFile(fs, "/out/c", "new");
  writeFile(fs, "/old", "old");
  fs.rename("/out/c", "/old");
  KJ_EXPECT(readFile(fs, "/old") == "new");

  fs.createDirectory("/out/dir");
  expectErrorKind(ErrorKind::CROSS_DEVICE, [&]() { fs.rename("/out/dir", "/dir"); });
  KJ_EXPECT(fs.isDirectory("/out/dir"));
  KJ_EXPECT(!fs.exists("/dir"));

  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.rename("/out/nothing", "/out/x"); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { fs.rename("/out/nothing", "/x"); });
}

KJ_TEST("extended attributes are forwarded") {
  TestClock clock;

  BackendOptions options;
  options.xattrs = XattrLookup([](kj::PathPtr, kj::StringPtr name)
      -> kj::Maybe<kj::Array<kj::byte>> {
    if (name == "SOME_XATTR_KEY") {
      return kj::heapArray<kj::byte>(kj::StringPtr("SOME_XATTR_VAL").asArray().asBytes());
    }
    return kj::none;
  });
  auto xattrBackend = newInMemoryBackend(clock, kj::mv(options));

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/foo"), xattrBackend->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), newInMemoryBackend(clock));

  KJ_IF_SOME(value, fs.getXattr("/foo/bar", "SOME_XATTR_KEY")) {
    KJ_EXPECT(kj::heapString(value.asPtr().asChars()) == "SOME_XATTR_VAL");
  } else {
    KJ_FAIL_EXPECT("attribute missing");
  }
  KJ_EXPECT(fs.getXattr("/foo/bar", "OTHER_KEY") == kj::none);
  KJ_EXPECT(fs.getXattr("/bar", "SOME_XATTR_KEY") == kj::none);
}

KJ_TEST("operations through a disk mount reach the host filesystem") {
  TestClock clock;
  TempDir tempDir;

  BackendOptions options;
  options.root = canonicalize("/out");
  auto disk = newDirectoryBackend(tempDir.get(), kj::mv(options));

  kj::Vector<Mount> mounts;
  mounts.add(Mount { kj::str("/out"), disk->clone() });
  UnionFilesystem fs(mounts.releaseAsArray(), newInMemoryBackend(clock));

  fs.createDirectoryAndParents("/out/a/b");
  writeFile(fs, "/out/a/b/file", "on disk");
  fs.createSymbolicLink("/out/link", "a/b/file");
  fs.rename("/out/a/b/file", "/out/a/renamed");

  auto host = tempDir.get();
  KJ_EXPECT(host->openFile(kj::Path({"a", "renamed"}))->readAllText() == "on disk");
  KJ_EXPECT(host->tryLstat(kj::Path({"a", "b", "file"})) == kj::none);
  KJ_EXPECT(host->readlink(kj::Path("link")) == "a/b/file");
  KJ_EXPECT(fs.listDirectory("/out/a").size() == 2);

  KJ_EXPECT(fs.remove("/out/a/renamed"));
  KJ_EXPECT(host->tryLstat(kj::Path({"a", "renamed"})) == kj::none);
}

}  // namespace
}  // namespace _ (private)
}  // namespace unionfs
