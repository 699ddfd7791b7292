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

#include "error.h"
#include <kj/test.h>

namespace unionfs {
namespace {

KJ_TEST("ErrorKind travels with the exception") {
  KJ_IF_SOME(exception, kj::runCatchingExceptions([]() {
    UNIONFS_FAIL(SYMLINK_LOOP, "went round ", 3, " times");
  })) {
    KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
    KJ_EXPECT(exception.getDescription() == "symlink loop: went round 3 times",
              exception.getDescription());
    KJ_IF_SOME(kind, getErrorKind(exception)) {
      KJ_EXPECT(kind == ErrorKind::SYMLINK_LOOP);
    } else {
      KJ_FAIL_EXPECT("no ErrorDetail attached");
    }
  } else {
    KJ_FAIL_EXPECT("should have thrown");
  }
}

KJ_TEST("exceptions from elsewhere have no ErrorKind") {
  KJ_IF_SOME(exception, kj::runCatchingExceptions([]() {
    KJ_FAIL_REQUIRE("backend exploded");
  })) {
    KJ_EXPECT(getErrorKind(exception) == kj::none);
  } else {
    KJ_FAIL_EXPECT("should have thrown");
  }
}

KJ_TEST("ErrorDetail serialization") {
  KJ_IF_SOME(bytes, (ErrorDetail { ErrorKind::CROSS_DEVICE }).trySerializeForKjException()) {
    KJ_EXPECT(bytes.size() == 1);
    KJ_IF_SOME(detail, ErrorDetail::tryDeserializeForKjException(bytes)) {
      KJ_EXPECT(detail.kind == ErrorKind::CROSS_DEVICE);
    } else {
      KJ_FAIL_EXPECT("failed to deserialize");
    }
  } else {
    KJ_FAIL_EXPECT("failed to serialize");
  }

  const kj::byte garbage[] = { 0xff };
  KJ_EXPECT(ErrorDetail::tryDeserializeForKjException(garbage) == kj::none);
}

KJ_TEST("ErrorKind names") {
  KJ_EXPECT(kj::str(ErrorKind::NOT_FOUND) == "not found");
  KJ_EXPECT(kj::str(ErrorKind::PERMISSION_DENIED) == "permission denied");
}

}  // namespace
}  // namespace unionfs
