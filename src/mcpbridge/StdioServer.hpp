// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Router.hpp>

#include <iosfwd>

namespace mcpbridge
{

/// @brief Serves newline-delimited JSON-RPC requests read from @p in, writing responses to @p out.
///
/// Blank lines are skipped. Each response is written as one line and flushed
/// immediately. Returns when @p in reaches end of stream.
void serveStdio(Router& router, std::istream& in, std::ostream& out);

} // namespace mcpbridge
