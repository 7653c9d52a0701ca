// Copyright 2019 The Bazel Authors. All rights reserved.
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

#include "tools/common/file_system.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <utility>

#include "absl/cleanup/cleanup.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "absl/time/time.h"
#include "tools/common/status.h"

namespace xcode_make {

bool PathExists(absl::string_view path) {
  std::string null_terminated_path(path.data(), path.length());
  struct stat stat_buf;
  return stat(null_terminated_path.c_str(), &stat_buf) == 0;
}

absl::StatusOr<std::string> ReadFile(absl::string_view path) {
  // `string_view`s are not required to be null-terminated, so get an explicit
  // null-terminated string that we can pass to the C functions below.
  std::string null_terminated_path(path.data(), path.length());
  auto MakeFailingStatus = [path](absl::string_view reason) {
    return MakeStatusFromErrno(
        absl::Substitute("Could not read $0; $1", path, reason));
  };

  int fd = open(null_terminated_path.c_str(), O_RDONLY);
  if (fd == -1) {
    return MakeFailingStatus("could not open file for reading");
  }

  absl::Cleanup closer = [fd] { close(fd); };

  struct stat stat_buf;
  if (fstat(fd, &stat_buf) == -1) {
    return MakeFailingStatus("could not stat file");
  }
  if (S_ISDIR(stat_buf.st_mode)) {
    return MakeStatusFromErrno(
        absl::Substitute("Could not read $0; path is a directory", path),
        EISDIR);
  }

  std::string contents;
  contents.reserve(stat_buf.st_size);
  char buffer[64 * 1024];
  while (true) {
    ssize_t bytes_read = read(fd, buffer, sizeof(buffer));
    if (bytes_read == 0) {
      break;
    }
    if (bytes_read == -1) {
      if (errno == EINTR) {
        continue;
      }
      return MakeFailingStatus("could not read file data");
    }
    contents.append(buffer, bytes_read);
  }
  return contents;
}

absl::StatusOr<absl::Time> GetModificationTime(absl::string_view path) {
  std::string null_terminated_path(path.data(), path.length());
  struct stat stat_buf;
  if (stat(null_terminated_path.c_str(), &stat_buf) == -1) {
    return MakeStatusFromErrno(absl::Substitute("Could not stat $0", path));
  }
  return absl::FromTimeT(stat_buf.st_mtime);
}

absl::Status WriteFile(absl::string_view path, absl::string_view contents) {
  std::string null_terminated_path(path.data(), path.length());
  auto MakeFailingStatus = [path](absl::string_view reason) {
    return MakeStatusFromErrno(
        absl::Substitute("Could not write $0; $1", path, reason));
  };

  int fd = open(null_terminated_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                0644);
  if (fd == -1) {
    return MakeFailingStatus("could not open file for writing");
  }

  absl::Cleanup closer = [fd] { close(fd); };

  while (!contents.empty()) {
    ssize_t bytes_written = write(fd, contents.data(), contents.size());
    if (bytes_written == -1) {
      if (errno == EINTR) {
        continue;
      }
      return MakeFailingStatus("could not write file data");
    }
    contents.remove_prefix(bytes_written);
  }

  std::move(closer).Cancel();
  if (close(fd) == -1) {
    return MakeFailingStatus("could not close file");
  }
  return absl::OkStatus();
}

}  // namespace xcode_make
