#include "taskwait/internal/progress.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace taskwait {

TEST(ProgressTest, PrintsLabelTicksAndDone) {
  std::ostringstream out;
  {
    internal::ScopedProgress progress(out, "Waiting", true);
    EXPECT_EQ(out.str(), "Waiting");
    progress.tick();
    progress.tick();
  }
  EXPECT_EQ(out.str(), "Waiting..OK\n");
}

TEST(ProgressTest, HiddenProgressPrintsNothing) {
  std::ostringstream out;
  {
    internal::ScopedProgress progress(out, "Running", false);
    progress.tick();
  }
  EXPECT_EQ(out.str(), "");
}

TEST(ProgressTest, CustomDoneLabel) {
  std::ostringstream out;
  { internal::ScopedProgress progress(out, "Running", true, "done"); }
  EXPECT_EQ(out.str(), "Runningdone\n");
}

TEST(ProgressTest, DoneLabelPrintedWhenUnwinding) {
  std::ostringstream out;
  EXPECT_THROW(
      {
        internal::ScopedProgress progress(out, "Waiting", true);
        progress.tick();
        throw std::runtime_error("status");
      },
      std::runtime_error);
  EXPECT_EQ(out.str(), "Waiting.OK\n");
}

}  // namespace taskwait
