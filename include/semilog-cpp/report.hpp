/// @file report.hpp
/// @brief Plain-text debug report of a materialized view.

#pragma once

#include <semilog-cpp/detailed.hpp>

#include <string>

namespace semilog_cpp {

/// Render every thread of view, in (author, id) order.
///
/// Each thread prints its author and id, its titles and every tag with a
/// positive net score as `tag (score)`, followed by a depth-first walk of
/// its reply tree through backrefs. Each message of the walk prints its
/// depth, author and id, and every live content version; redacted versions
/// are omitted. A message is printed at most once per thread, so cyclic
/// backrefs terminate.
auto render_report(const Detailed& view) -> std::string;

}  // namespace semilog_cpp
