#include "taskwait/internal/progress.hpp"

namespace taskwait::internal {

ScopedProgress::ScopedProgress(std::ostream& out, std::string_view label, bool display,
                               std::string_view done)
    : out_(out), done_(done), display_(display) {
  if (display_) {
    out_ << label << std::flush;
  }
}

ScopedProgress::~ScopedProgress() {
  if (display_) {
    out_ << done_ << std::endl;
  }
}

void ScopedProgress::tick() {
  if (display_) {
    out_ << '.' << std::flush;
  }
}

}  // namespace taskwait::internal
