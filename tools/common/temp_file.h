// Copyright 2018 The Bazel Authors. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef XCODE_MAKE_TOOLS_COMMON_TEMP_FILE_H_
#define XCODE_MAKE_TOOLS_COMMON_TEMP_FILE_H_

#include <fts.h>
#include <string.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "tools/common/file_system.h"
#include "tools/common/path_utils.h"

namespace xcode_make {

// An RAII temporary directory that is recursively deleted. Used to stage logs
// and the side files they reference.
class TempDirectory {
 public:
  // Create a new temporary directory using the given path template string (the
  // same form used by `mkdtemp`). The directory will automatically be deleted
  // when the object goes out of scope.
  static std::unique_ptr<TempDirectory> Create(
      absl::string_view path_template) {
    absl::string_view tmp_dir;
    if (const char *env_value = getenv("TMPDIR")) {
      tmp_dir = env_value;
    } else {
      tmp_dir = "/tmp";
    }
    std::string path = absl::StrCat(tmp_dir, "/", path_template);
    if (mkdtemp(path.data()) == nullptr) {
      std::cerr << "Failed to create temporary directory '" << path
                << "': " << strerror(errno) << std::endl;
      return nullptr;
    }
    return std::unique_ptr<TempDirectory>(new TempDirectory(path));
  }

  // Explicitly make TempDirectory non-copyable and movable.
  TempDirectory(const TempDirectory &) = delete;
  TempDirectory &operator=(const TempDirectory &) = delete;
  TempDirectory(TempDirectory &&) = default;
  TempDirectory &operator=(TempDirectory &&) = default;

  ~TempDirectory() {
    if (path_.empty()) {
      return;
    }
    char *files[] = {path_.data(), nullptr};
    // Don't have the walk change directories, don't traverse symlinks, and
    // don't cross devices.
    FTS *fts_handle =
        fts_open(files, FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV, nullptr);
    if (fts_handle == nullptr) {
      return;
    }

    while (FTSENT *entry = fts_read(fts_handle)) {
      switch (entry->fts_info) {
        case FTS_F:        // regular file
        case FTS_SL:       // symlink
        case FTS_SLNONE:   // symlink without target
        case FTS_DP:       // directory, post-order (after its children)
        case FTS_DEFAULT:  // other non-error conditions
          remove(entry->fts_accpath);
          break;
      }
    }

    fts_close(fts_handle);
  }

  // Gets the path to the temporary directory.
  absl::string_view GetPath() const { return path_; }

  // Returns the path of `name` inside the temporary directory.
  std::string PathOf(absl::string_view name) const {
    return JoinPath(path_, name);
  }

  // Writes `contents` to the file `name` inside the temporary directory and
  // returns its path.
  std::string WriteFile(absl::string_view name, absl::string_view contents) {
    std::string file_path = PathOf(name);
    absl::Status status = xcode_make::WriteFile(file_path, contents);
    if (!status.ok()) {
      std::cerr << status << std::endl;
    }
    return file_path;
  }

 private:
  explicit TempDirectory(absl::string_view path) : path_(path) {}

  std::string path_;
};

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_COMMON_TEMP_FILE_H_
