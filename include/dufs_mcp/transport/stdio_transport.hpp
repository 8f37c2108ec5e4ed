#pragma once

#include <dufs_mcp/core/result.hpp>
#include <dufs_mcp/mcp/mcp_server.hpp>

#include <iostream>

namespace dufs_mcp {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON-RPC over a pair of streams.
//
// One line in, at most one line out, strictly in order: a request is fully
// handled before the next line is read. Blank lines are skipped; an
// undecodable line is answered with a parse error and the loop continues.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    explicit StdioTransport(const McpServer& server,
                            std::istream& in = std::cin,
                            std::ostream& out = std::cout);

    // Serve until end of input (Ok) or a read/write failure (Err).
    [[nodiscard]] Result<void, Error> Run();

private:
    const McpServer& server_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace dufs_mcp
