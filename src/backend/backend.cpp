#include "backend/backend.hpp"

#include "protocol/jsonrpc.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <set>
#include <utility>

auto fetch_tool_catalog(Backend& backend)
    -> boost::asio::awaitable<std::expected<ToolPage, RpcError>>
{
    ToolPage                   catalog{};
    std::set<std::string>      seen_cursors;
    std::optional<std::string> cursor;

    while (true) {
        Json::Value params{Json::nullValue};
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto result = co_await backend.request(
            std::string{method_name(McpMethod::kToolsList)}, std::move(params));
        if (!result) {
            co_return std::unexpected(result.error());
        }

        auto page = parse_tool_page(*result);
        if (!page) {
            co_return std::unexpected(page.error());
        }

        catalog.dropped += page->dropped;
        for (auto& tool : page->tools) {
            catalog.tools.push_back(std::move(tool));
        }

        if (!page->next_cursor) {
            break;
        }
        if (!seen_cursors.insert(*page->next_cursor).second) {
            co_return std::unexpected(RpcError{
                RpcErrorCode::kInternalError,
                fmt::format("backend repeated tools/list cursor '{}'", *page->next_cursor)});
        }
        cursor = std::move(page->next_cursor);
    }

    if (catalog.dropped > 0) {
        spdlog::warn("[backend] dropped {} unreadable tool definition(s) from catalog",
                     catalog.dropped);
    }
    spdlog::debug("[backend] fetched {} tool(s) over {} page(s)",
                  catalog.tools.size(), seen_cursors.size() + 1);
    co_return catalog;
}
