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
#include "test-util.h"

namespace unionfs {
namespace _ {  // private
namespace {

kj::Path P(kj::StringPtr text) { return canonicalize(text); }

kj::String readAll(kj::Own<kj::InputStream> stream) {
  return stream->readAllText();
}

void write(kj::Own<kj::OutputStream> stream, kj::StringPtr content) {
  stream->write(content.begin(), content.size());
}

KJ_TEST("in-memory backend basics") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);

  KJ_EXPECT(backend->stat(P("/"), true).type == kj::FsNode::Type::DIRECTORY);
  KJ_EXPECT(backend->tryStat(P("/foo"), true) == kj::none);
  KJ_EXPECT(backend->listNames(P("/")).size() == 0);

  clock.tick();
  KJ_EXPECT(backend->tryCreateDirectory(P("/foo")));
  KJ_EXPECT(!backend->tryCreateDirectory(P("/foo")));
  KJ_EXPECT(backend->stat(P("/foo"), true).lastModified == clock.now());

  write(backend->openOutputStream(P("/foo/bar"), false), "hello");
  write(backend->openOutputStream(P("/foo/baz"), false), "world");
  KJ_EXPECT(readAll(backend->openInputStream(P("/foo/bar"))) == "hello");

  auto meta = backend->stat(P("/foo/bar"), true);
  KJ_EXPECT(meta.type == kj::FsNode::Type::FILE);
  KJ_EXPECT(meta.size == 5);

  auto names = backend->listNames(P("/foo"));
  KJ_ASSERT(names.size() == 2);
  KJ_EXPECT(names[0] == "bar");
  KJ_EXPECT(names[1] == "baz");

  KJ_EXPECT(backend->tryListNames(P("/foo/bar")) == kj::none);
  KJ_EXPECT(backend->tryOpenInputStream(P("/foo/qux")) == kj::none);
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { backend->listNames(P("/nope")); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { backend->openInputStream(P("/nope")); });
}

KJ_TEST("in-memory backend requires existing parents") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);

  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { backend->tryCreateDirectory(P("/a/b")); });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() {
    backend->openOutputStream(P("/a/file"), false);
  });
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { backend->tryCreateSymlink(P("/a/link"), "x"); });
  KJ_EXPECT(backend->tryStat(P("/a"), false) == kj::none);
}

KJ_TEST("output streams truncate or append") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);

  write(backend->openOutputStream(P("/file"), false), "first");
  write(backend->openOutputStream(P("/file"), false), "abc");
  KJ_EXPECT(readAll(backend->openInputStream(P("/file"))) == "abc");

  write(backend->openOutputStream(P("/file"), true), "def");
  KJ_EXPECT(readAll(backend->openInputStream(P("/file"))) == "abcdef");

  backend->tryCreateDirectory(P("/dir"));
  KJ_EXPECT_THROW_MESSAGE("not a file", backend->openOutputStream(P("/dir"), false));
}

KJ_TEST("remove") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);

  backend->tryCreateDirectory(P("/dir"));
  write(backend->openOutputStream(P("/dir/file"), false), "x");

  KJ_EXPECT_THROW_MESSAGE("directory not empty", backend->tryRemove(P("/dir")));
  KJ_EXPECT(backend->tryRemove(P("/dir/file")));
  KJ_EXPECT(!backend->tryRemove(P("/dir/file")));
  KJ_EXPECT(backend->tryRemove(P("/dir")));
  KJ_EXPECT(backend->tryStat(P("/dir"), false) == kj::none);
}

KJ_TEST("symlinks are followed within the backend") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);

  backend->tryCreateDirectory(P("/dir"));
  write(backend->openOutputStream(P("/dir/file"), false), "content");

  KJ_EXPECT(backend->tryCreateSymlink(P("/rel"), "dir/file"));
  KJ_EXPECT(backend->tryCreateSymlink(P("/dir/up"), "../dir/./file"));
  KJ_EXPECT(backend->tryCreateSymlink(P("/abs"), "/dir"));
  KJ_EXPECT(backend->tryCreateSymlink(P("/chain"), "rel"));
  KJ_EXPECT(backend->tryCreateSymlink(P("/dangling"), "missing"));
  KJ_EXPECT(!backend->tryCreateSymlink(P("/rel"), "elsewhere"));

  KJ_EXPECT(backend->stat(P("/rel"), false).type == kj::FsNode::Type::SYMLINK);
  KJ_EXPECT(backend->stat(P("/rel"), true).type == kj::FsNode::Type::FILE);
  KJ_EXPECT(backend->stat(P("/chain"), true).type == kj::FsNode::Type::FILE);
  KJ_EXPECT(backend->stat(P("/abs"), true).type == kj::FsNode::Type::DIRECTORY);
  KJ_EXPECT(backend->tryStat(P("/dangling"), true) == kj::none);
  KJ_EXPECT(backend->tryStat(P("/dangling"), false) != kj::none);

  KJ_EXPECT(readAll(backend->openInputStream(P("/dir/up"))) == "content");
  KJ_EXPECT(backend->listNames(P("/abs")).size() == 2);

  KJ_EXPECT(backend->readlink(P("/dir/up")) == "../dir/./file");
  KJ_EXPECT(backend->tryReadlink(P("/dir/file")) == kj::none);
  KJ_EXPECT(backend->tryReadlink(P("/nothing")) == kj::none);

  // Writing through a symlink writes its target.
  write(backend->openOutputStream(P("/rel"), false), "replaced");
  KJ_EXPECT(readAll(backend->openInputStream(P("/dir/file"))) == "replaced");
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() {
    backend->openOutputStream(P("/dangling"), false);
  });
}

KJ_TEST("symlink loops within the backend") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);

  backend->tryCreateSymlink(P("/a"), "b");
  backend->tryCreateSymlink(P("/b"), "a");
  backend->tryCreateSymlink(P("/self"), "./self");

  expectErrorKind(ErrorKind::SYMLINK_LOOP, [&]() { backend->tryStat(P("/a"), true); });
  expectErrorKind(ErrorKind::SYMLINK_LOOP, [&]() { backend->tryStat(P("/self"), true); });
  KJ_EXPECT(backend->stat(P("/a"), false).type == kj::FsNode::Type::SYMLINK);
}

KJ_TEST("rename within the backend") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);

  backend->tryCreateDirectory(P("/dir"));
  write(backend->openOutputStream(P("/dir/old"), false), "data");
  write(backend->openOutputStream(P("/victim"), false), "doomed");

  KJ_EXPECT(backend->tryRename(P("/dir/old"), P("/dir/new")));
  KJ_EXPECT(backend->tryStat(P("/dir/old"), false) == kj::none);
  KJ_EXPECT(readAll(backend->openInputStream(P("/dir/new"))) == "data");

  KJ_EXPECT(backend->tryRename(P("/dir/new"), P("/victim")));
  KJ_EXPECT(readAll(backend->openInputStream(P("/victim"))) == "data");

  KJ_EXPECT(backend->tryRename(P("/dir"), P("/moved")));
  KJ_EXPECT(backend->stat(P("/moved"), false).type == kj::FsNode::Type::DIRECTORY);

  KJ_EXPECT(!backend->tryRename(P("/missing"), P("/whatever")));
  KJ_EXPECT_THROW_MESSAGE("into itself", backend->tryRename(P("/moved"), P("/moved/sub")));

  // Renaming onto itself changes nothing.
  KJ_EXPECT(backend->tryRename(P("/victim"), P("/victim")));
  KJ_EXPECT(readAll(backend->openInputStream(P("/victim"))) == "data");
  KJ_EXPECT(backend->tryRename(P("/moved"), P("/moved/.")));
  KJ_EXPECT(backend->stat(P("/moved"), false).type == kj::FsNode::Type::DIRECTORY);
}

KJ_TEST("backend with a virtual root") {
  TestClock clock;
  BackendOptions options;
  options.root = P("/out/dir");
  auto backend = newInMemoryBackend(clock, kj::mv(options));

  // The root exists; nothing outside of it does.
  KJ_EXPECT(backend->stat(P("/out/dir"), true).type == kj::FsNode::Type::DIRECTORY);
  KJ_EXPECT(backend->tryStat(P("/"), true) == kj::none);
  KJ_EXPECT(backend->tryStat(P("/out"), true) == kj::none);
  KJ_EXPECT(backend->tryListNames(P("/out")) == kj::none);

  KJ_EXPECT(backend->tryCreateDirectory(P("/out/dir/biz")));
  KJ_EXPECT(!backend->tryCreateDirectory(P("/out/dir")));
  expectErrorKind(ErrorKind::NOT_FOUND, [&]() { backend->tryCreateDirectory(P("/elsewhere")); });

  auto names = backend->listNames(P("/out/dir"));
  KJ_ASSERT(names.size() == 1);
  KJ_EXPECT(names[0] == "biz");

  // A link leading out of the root can't be followed here.
  backend->tryCreateSymlink(P("/out/dir/escape"), "../../etc");
  backend->tryCreateSymlink(P("/out/dir/stay"), "/out/dir/biz");
  KJ_EXPECT(backend->tryStat(P("/out/dir/escape"), true) == kj::none);
  KJ_EXPECT(backend->stat(P("/out/dir/stay"), true).type == kj::FsNode::Type::DIRECTORY);

  KJ_EXPECT_THROW_MESSAGE("root", backend->tryRemove(P("/out/dir")));
}

KJ_TEST("backend policy and xattr injection") {
  TestClock clock;

  BackendOptions options;
  options.modificationPolicy = ModificationPolicy([](kj::PathPtr path) {
    return !path.startsWith(kj::Path("frozen"));
  });
  options.xattrs = XattrLookup([](kj::PathPtr, kj::StringPtr name)
      -> kj::Maybe<kj::Array<kj::byte>> {
    if (name == "SOME_XATTR_KEY") {
      return kj::heapArray<kj::byte>(kj::StringPtr("SOME_XATTR_VAL").asArray().asBytes());
    }
    return kj::none;
  });
  auto backend = newInMemoryBackend(clock, kj::mv(options));

  KJ_EXPECT(backend->supportsModifications(P("/anything")));
  KJ_EXPECT(!backend->supportsModifications(P("/frozen")));
  KJ_EXPECT(!backend->supportsModifications(P("/frozen/deeper")));

  KJ_IF_SOME(value, backend->getXattr(P("/whatever"), "SOME_XATTR_KEY")) {
    KJ_EXPECT(kj::heapString(value.asPtr().asChars()) == "SOME_XATTR_VAL");
  } else {
    KJ_FAIL_EXPECT("xattr missing");
  }
  KJ_EXPECT(backend->getXattr(P("/whatever"), "OTHER_KEY") == kj::none);

  // Without injection, an in-memory directory has no extended attributes at all.
  auto plain = newInMemoryBackend(clock);
  KJ_EXPECT(plain->supportsModifications(P("/frozen")));
  plain->tryCreateDirectory(P("/dir"));
  KJ_EXPECT(plain->getXattr(P("/dir"), "user.foo") == kj::none);
}

KJ_TEST("clone shares the backend") {
  TestClock clock;
  auto backend = newInMemoryBackend(clock);
  auto other = backend->clone();

  KJ_EXPECT(other.get() == backend.get());
  backend->tryCreateDirectory(P("/shared"));
  KJ_EXPECT(other->stat(P("/shared"), true).type == kj::FsNode::Type::DIRECTORY);
}

// -------------------------------------------------------------------
// disk

KJ_TEST("disk backend") {
  TempDir tempDir;
  BackendOptions options;
  options.root = P("/mnt");
  auto backend = newDirectoryBackend(tempDir.get(), kj::mv(options));

  KJ_EXPECT(backend->tryCreateDirectory(P("/mnt/sub")));
  write(backend->openOutputStream(P("/mnt/sub/file"), false), "on disk");
  KJ_EXPECT(backend->tryCreateSymlink(P("/mnt/link"), "sub/file"));

  // Everything lands under the host directory, relative to the virtual root.
  auto host = tempDir.get();
  KJ_EXPECT(host->openFile(kj::Path({"sub", "file"}))->readAllText() == "on disk");
  KJ_EXPECT(host->readlink(kj::Path("link")) == "sub/file");

  KJ_EXPECT(readAll(backend->openInputStream(P("/mnt/link"))) == "on disk");
  KJ_EXPECT(backend->stat(P("/mnt/link"), true).type == kj::FsNode::Type::FILE);

  auto names = backend->listNames(P("/mnt"));
  KJ_ASSERT(names.size() == 2);
  KJ_EXPECT(names[0] == "link");
  KJ_EXPECT(names[1] == "sub");

  // Nothing sets this attribute, whether or not the filesystem supports user xattrs.
  KJ_EXPECT(backend->getXattr(P("/mnt/sub/file"), "user.unionfs-test") == kj::none);

  KJ_EXPECT(backend->tryRemove(P("/mnt/link")));
  KJ_EXPECT(backend->tryRemove(P("/mnt/sub/file")));
  KJ_EXPECT(backend->tryRemove(P("/mnt/sub")));
  KJ_EXPECT(backend->listNames(P("/mnt")).size() == 0);
}

}  // namespace
}  // namespace _ (private)
}  // namespace unionfs
