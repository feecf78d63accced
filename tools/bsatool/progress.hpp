#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace bsatool {

// Single-line progress bar. On a terminal it is redrawn in place after each
// tick; otherwise only the final line is printed.
class ProgressBar {
public:
  ProgressBar(std::ostream &out, size_t total, bool interactive, int width = 40);

  void tick();

  // Print the final state followed by msg
  void finish(std::string_view msg);

  size_t done() const { return done_; }

  // "[=====>    ] done/total"
  std::string line() const;

private:
  std::ostream &out_;
  size_t total_;
  size_t done_ = 0;
  bool interactive_;
  int width_;
};

} // namespace bsatool
