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

#include "error.h"
#include "path.h"
#include "union-fs.h"
#include <kj/test.h>
#include <kj/time.h>
#include <kj/debug.h>
#include <kj/miniposix.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <dirent.h>
#include <stdlib.h>
#include <errno.h>

UNIONFS_BEGIN_HEADER

namespace unionfs {
namespace _ {  // private

class TestClock final: public kj::Clock {
public:
  void tick() {
    time += 1 * kj::SECONDS;
  }

  kj::Date now() const override { return time; }

private:
  kj::Date time = kj::UNIX_EPOCH + 1 * kj::SECONDS;
};

template <typename Func>
void expectErrorKind(ErrorKind expected, Func&& func) {
  KJ_IF_SOME(exception, kj::runCatchingExceptions(kj::fwd<Func>(func))) {
    KJ_IF_SOME(kind, getErrorKind(exception)) {
      KJ_EXPECT(kind == expected, kind, expected, exception.getDescription());
    } else {
      KJ_FAIL_EXPECT("exception carries no ErrorKind", expected, exception.getDescription());
    }
  } else {
    KJ_FAIL_EXPECT("code did not throw", expected);
  }
}

inline void writeFile(const UnionFilesystem& fs, kj::StringPtr path, kj::StringPtr content) {
  fs.openOutputStream(path)->write(content.begin(), content.size());
}

inline kj::String readFile(const UnionFilesystem& fs, kj::StringPtr path) {
  return fs.openInputStream(path)->readAllText();
}

inline kj::String readFile(const Backend& backend, kj::StringPtr path) {
  return backend.openInputStream(canonicalize(path))->readAllText();
}

#if __ANDROID__
#define VAR_TMP "/data/local/tmp"
#else
#define VAR_TMP "/var/tmp"
#endif

class TempDir {
  // A fresh directory on the host filesystem, deleted with everything in it on destruction.

public:
  TempDir(): filename(kj::heapString(VAR_TMP "/unionfs-test.XXXXXX")) {
    if (mkdtemp(filename.begin()) == nullptr) {
      KJ_FAIL_SYSCALL("mkdtemp", errno, filename);
    }
  }

  kj::Own<kj::Directory> get() {
    int fd;
    KJ_SYSCALL(fd = open(filename.cStr(), O_RDONLY));
    return kj::newDiskDirectory(kj::AutoCloseFd(fd));
  }

  ~TempDir() noexcept(false) {
    recursiveDelete(filename);
  }

private:
  kj::String filename;

  static void recursiveDelete(kj::StringPtr path) {
    {
      DIR* dir = opendir(path.cStr());
      KJ_ASSERT(dir != nullptr);
      KJ_DEFER(closedir(dir));

      for (;;) {
        auto entry = readdir(dir);
        if (entry == nullptr) break;

        kj::StringPtr name = entry->d_name;
        if (name == "." || name == "..") continue;

        auto subPath = kj::str(path, '/', entry->d_name);

        struct stat stats;
        KJ_SYSCALL(lstat(subPath.cStr(), &stats));

        if (S_ISDIR(stats.st_mode)) {
          recursiveDelete(subPath);
        } else {
          KJ_SYSCALL(unlink(subPath.cStr()));
        }
      }
    }

    KJ_SYSCALL(rmdir(path.cStr()));
  }
};

}  // namespace _ (private)
}  // namespace unionfs

UNIONFS_END_HEADER
