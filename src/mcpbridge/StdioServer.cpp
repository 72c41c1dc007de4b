// SPDX-License-Identifier: Apache-2.0
#include "StdioServer.hpp"

#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <istream>
#include <ostream>
#include <string>

namespace mcpbridge
{

void serveStdio(Router& router, std::istream& in, std::ostream& out)
{
    log::info("Serving MCP over stdio");

    auto line = std::string {};
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;

        log::trace("<- {}", line);

        auto response = router.handleLine(line);
        if (!response)
            continue;

        auto const serialized = jsonrpc::serialize(*response);
        log::trace("-> {}", serialized);
        out << serialized << '\n';
        out.flush();
    }

    log::info("stdin closed");
}

} // namespace mcpbridge
