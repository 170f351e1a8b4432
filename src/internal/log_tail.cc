#include "taskwait/internal/log_tail.hpp"

#include <plog/Log.h>

namespace taskwait::internal {

std::size_t tail_log(std::ostream& out, std::size_t skip, const LogLines& lines) {
  if (!lines || lines->size() <= skip) {
    if (lines && lines->size() < skip) {
      PLOG_DEBUG << "task log shrank from " << skip << " to " << lines->size() << " lines";
    }
    return skip;
  }

  for (std::size_t i = skip; i < lines->size(); ++i) {
    out << (*lines)[i] << '\n';
  }
  out.flush();
  return lines->size();
}

}  // namespace taskwait::internal
