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

#include "backend.h"
#include "error.h"
#include "path.h"

namespace unionfs {

kj::FsNode::Metadata Backend::stat(kj::PathPtr path, bool followSymlinks) const {
  KJ_IF_SOME(meta, tryStat(path, followSymlinks)) {
    return meta;
  }
  UNIONFS_FAIL(NOT_FOUND, "no such file or directory: ", toAbsoluteString(path));
}

kj::Array<kj::String> Backend::listNames(kj::PathPtr path) const {
  KJ_IF_SOME(names, tryListNames(path)) {
    return kj::mv(names);
  }
  UNIONFS_FAIL(NOT_FOUND, "no such directory: ", toAbsoluteString(path));
}

kj::Own<kj::InputStream> Backend::openInputStream(kj::PathPtr path) const {
  KJ_IF_SOME(stream, tryOpenInputStream(path)) {
    return kj::mv(stream);
  }
  UNIONFS_FAIL(NOT_FOUND, "no such file: ", toAbsoluteString(path));
}

kj::String Backend::readlink(kj::PathPtr path) const {
  KJ_IF_SOME(content, tryReadlink(path)) {
    return kj::mv(content);
  }
  UNIONFS_FAIL(NOT_FOUND, "not a symlink: ", toAbsoluteString(path));
}

}  // namespace unionfs
