#include <algorithm>
#include <format>
#include <ostream>

#include "progress.hpp"

namespace bsatool {

ProgressBar::ProgressBar(std::ostream &out, size_t total, bool interactive, int width)
    : out_(out), total_(total), interactive_(interactive), width_(std::max(width, 4)) {}

void ProgressBar::tick() {
  if (done_ < total_) {
    ++done_;
  }
  if (interactive_) {
    out_ << '\r' << line() << std::flush;
  }
}

void ProgressBar::finish(std::string_view msg) {
  if (interactive_) {
    out_ << '\r';
  }
  out_ << line() << ' ' << msg << '\n';
}

std::string ProgressBar::line() const {
  int fill = total_ == 0 ? width_ : static_cast<int>(done_ * width_ / total_);
  fill = std::clamp(fill, 0, width_);

  std::string bar = "[";
  for (int i = 0; i < width_; ++i) {
    if (i < fill) {
      bar += '=';
    } else if (i == fill) {
      bar += '>';
    } else {
      bar += ' ';
    }
  }
  bar += "]";
  return std::format("{} {}/{}", bar, done_, total_);
}

} // namespace bsatool
