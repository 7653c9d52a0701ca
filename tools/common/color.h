// Copyright 2022 The Bazel Authors. All rights reserved.
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

#ifndef XCODE_MAKE_TOOLS_COMMON_COLOR_H_
#define XCODE_MAKE_TOOLS_COMMON_COLOR_H_

#include <ostream>

#include "absl/strings/string_view.h"

namespace xcode_make {

// A color that can be passed to the constructor of `WithColor` when wrapping
// an `ostream`.
class Color {
 public:
  static const Color kBold;
  static const Color kBoldRed;
  static const Color kBoldGreen;
  static const Color kBoldMagenta;
  static const Color kReset;

  friend std::ostream &operator<<(std::ostream &stream, Color color) {
    return stream << "\x1b[" << color.code_ << "m";
  }

 private:
  constexpr explicit Color(absl::string_view code) : code_(code) {}

  // The ANSI code for the color.
  absl::string_view code_;
};

inline constexpr const Color Color::kBold = Color("1");
inline constexpr const Color Color::kBoldRed = Color("1;31");
inline constexpr const Color Color::kBoldGreen = Color("1;32");
inline constexpr const Color Color::kBoldMagenta = Color("1;35");
inline constexpr const Color Color::kReset = Color("0");

// An RAII-style wrapper for an `std::ostream` that prints the ANSI code for a
// color when initialized and prints the reset code on destruction. When
// `enabled` is false the wrapper writes the text alone, so callers can honor a
// `--no-color` setting without branching at every call site.
//
// Modeled loosely after the `llvm::WithColor` support class.
class WithColor {
 public:
  WithColor(std::ostream &stream, Color color, bool enabled = true)
      : stream_(stream), enabled_(enabled) {
    if (enabled_) {
      stream << color;
    }
  }

  ~WithColor() {
    if (enabled_) {
      stream_ << Color::kReset;
    }
  }

  template <typename T>
  WithColor &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

  WithColor &operator<<(std::ostream &(*modifier)(std::ostream &)) {
    modifier(stream_);
    return *this;
  }

 private:
  // The wrapped `ostream`.
  std::ostream &stream_;

  // Whether escape sequences are written at all.
  bool enabled_;
};

}  // namespace xcode_make

#endif  // XCODE_MAKE_TOOLS_COMMON_COLOR_H_
