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
#include <kj/debug.h>

namespace unionfs {

kj::StringPtr KJ_STRINGIFY(ErrorKind kind) {
  static const char* NAMES[] = {
    "configuration error",
    "not found",
    "permission denied",
    "symlink loop",
    "cross-device operation"
  };
  return NAMES[static_cast<uint>(kind)];
}

kj::Maybe<kj::Array<kj::byte>> ErrorDetail::trySerializeForKjException() const {
  auto result = kj::heapArray<kj::byte>(1);
  result[0] = static_cast<kj::byte>(kind);
  return kj::mv(result);
}

kj::Maybe<ErrorDetail> ErrorDetail::tryDeserializeForKjException(
    kj::ArrayPtr<const kj::byte> bytes) {
  if (bytes.size() != 1 || bytes[0] > static_cast<kj::byte>(ErrorKind::CROSS_DEVICE)) {
    return kj::none;
  }
  return ErrorDetail { static_cast<ErrorKind>(bytes[0]) };
}

kj::Exception makeError(ErrorKind kind, const char* file, int line, kj::String description) {
  kj::Exception exception(kj::Exception::Type::FAILED, file, line,
                          kj::str(kind, ": ", description));
  exception.setDetail(ErrorDetail { kind });
  return exception;
}

kj::Maybe<ErrorKind> getErrorKind(const kj::Exception& exception) {
  KJ_IF_SOME(detail, exception.getDetail<ErrorDetail>()) {
    return detail.kind;
  }
  return kj::none;
}

}  // namespace unionfs
