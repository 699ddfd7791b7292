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
#include <kj/exception.h>
#include <kj/string.h>

UNIONFS_BEGIN_HEADER

namespace unionfs {

enum class ErrorKind: uint8_t {
  // Failures the union filesystem manufactures itself. Anything else a caller sees was thrown by
  // a backend and has no ErrorKind attached.

  CONFIGURATION,
  // The mount table or the default backend given to the constructor is unusable.

  NOT_FOUND,
  // The path does not exist on the backend it routes to. This is also how an implicit
  // (single-backend) symlink follow that leaves its backend is reported.

  PERMISSION_DENIED,
  // The backend servicing a mutation reported that it does not support modifications.

  SYMLINK_LOOP,
  // Symlink resolution revisited a state or exceeded MAX_SYMLINK_HOPS.

  CROSS_DEVICE
  // A directory cannot be renamed from one backend into another.
};

kj::StringPtr KJ_STRINGIFY(ErrorKind kind);

struct ErrorDetail {
  // Attached to every exception thrown through UNIONFS_FAIL(). Use getErrorKind() rather than
  // reading it directly.

  static constexpr uint64_t EXCEPTION_DETAIL_TYPE_ID = 0xb1c5d0e6a3f24e17ull;

  ErrorKind kind;

  kj::Maybe<kj::Array<kj::byte>> trySerializeForKjException() const;
  static kj::Maybe<ErrorDetail> tryDeserializeForKjException(kj::ArrayPtr<const kj::byte> bytes);
  // Single-byte encoding, so that the kind survives a trip through Cap'n Proto RPC.
};

kj::Exception makeError(ErrorKind kind, const char* file, int line, kj::String description);
// Builds a FAILED exception carrying `kind` as an ErrorDetail.

kj::Maybe<ErrorKind> getErrorKind(const kj::Exception& exception);
// Returns the kind attached by makeError(), or kj::none for an exception raised elsewhere
// (i.e. a backend error).

#define UNIONFS_FAIL(kind, ...) \
  ::kj::throwFatalException(::unionfs::makeError( \
      ::unionfs::ErrorKind::kind, __FILE__, __LINE__, ::kj::str(__VA_ARGS__)))
// Throws an exception of the given ErrorKind. The remaining arguments are stringified and
// concatenated into the description, e.g.:
//
//     UNIONFS_FAIL(NOT_FOUND, "no such file or directory: ", path);

}  // namespace unionfs

UNIONFS_END_HEADER
