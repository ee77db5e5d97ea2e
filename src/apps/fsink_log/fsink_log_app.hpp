// File: src/apps/fsink_log/fsink_log_app.hpp
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace fsink::app {

// fsink_log entry point with injectable streams. `args` excludes argv[0].
// Each line of `in` is logged with "\n" appended.
// Exit codes: 0 ok, 1 config load failure, 2 usage or runtime failure.
int run_fsink_log(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
                  std::ostream& err);

}  // namespace fsink::app
