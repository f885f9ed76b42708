#include "cpgslice/graph.hpp"

#include "cpgslice/format.hpp"
#include "cpgslice/utils.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

using namespace cpgslice::literals;

namespace cpgslice::graph {
    namespace detail {

        static constexpr auto npos = std::string_view::npos;

        enum class scan_state : uint8_t {
            outside,
            in_node_block,
            in_quoted_string,
            in_quoted_string_escape,
        };

        struct block_end {
            size_t close_bracket{};
            size_t semicolon{};
        };

        static constexpr bool is_horizontal_space(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
        }

        static size_t skip_horizontal_space(std::string_view text, size_t pos, size_t limit) {
            while (pos < limit && is_horizontal_space(text[pos])) {
                ++pos;
            }
            return pos;
        }

        static size_t skip_space(std::string_view text, size_t pos, size_t limit) {
            while (pos < limit && (is_horizontal_space(text[pos]) || text[pos] == '\n')) {
                ++pos;
            }
            return pos;
        }

        // `pos` is on an opening quote; returns the index of the matching
        // closing quote, or npos when the line ends first.
        static size_t find_closing_quote(std::string_view text, size_t pos, size_t limit) {
            auto end = pos + 1U;
            while (end < limit) {
                if (text[end] == '"') {
                    return end;
                }
                if (text[end] == '\\' && end + 1U < limit) {
                    end += 2U;
                    continue;
                }
                ++end;
            }
            return npos;
        }

        // Walks an attribute block starting just past its '['. The block ends at
        // the first ']' seen outside a quoted string that is followed, after
        // optional whitespace, by ';'. Quote state and the search for ';' both
        // stop at `limit`.
        static std::optional<block_end> scan_attribute_block(std::string_view text, size_t pos, size_t limit) {
            auto state = scan_state::in_node_block;
            for (; pos < limit; ++pos) {
                auto c = text[pos];
                switch (state) {
                    case scan_state::in_quoted_string_escape:
                        state = scan_state::in_quoted_string;
                        break;
                    case scan_state::in_quoted_string:
                        if (c == '\\') {
                            state = scan_state::in_quoted_string_escape;
                        }
                        else if (c == '"') {
                            state = scan_state::in_node_block;
                        }
                        break;
                    case scan_state::in_node_block:
                        if (c == '"') {
                            state = scan_state::in_quoted_string;
                        }
                        else if (c == ']') {
                            auto k = skip_space(text, pos + 1U, limit);
                            if (k < limit && text[k] == ';') {
                                return block_end{.close_bracket = pos, .semicolon = k};
                            }
                        }
                        break;
                    case scan_state::outside:
                        return std::nullopt;
                }
            }
            return std::nullopt;
        }

        static size_t count_newlines(std::string_view text, size_t from, size_t to) {
            return static_cast<size_t>(std::count(text.begin() + from, text.begin() + to, '\n'));
        }

        struct line_cursor {
            std::string_view text{};
            size_t begin{};
            size_t end{};
            size_t number{};

            bool at_end() const { return begin >= text.size(); }

            void load() {
                end = text.find('\n', begin);
                if (end == npos) {
                    end = text.size();
                }
            }

            void next_line() {
                begin = (end >= text.size()) ? text.size() : end + 1U;
                ++number;
            }
        };

        static void report(scan_result& result, size_t line, std::string message) {
            debug_log("line ", line, ": ", message);
            result.diagnostics.push_back(
                    diagnostic{
                            .kind = diagnostic_kind::malformed_declaration, .line = line, .message = std::move(message)});
        }

        static std::string_view inner_id(std::string_view text, size_t open_quote, size_t close_quote) {
            return text.substr(open_quote + 1U, close_quote - open_quote - 1U);
        }

        static void scan_edge(
                scan_result& result,
                const line_cursor& cursor,
                size_t start,
                size_t source_close,
                size_t arrow) {
            const auto& text = cursor.text;
            auto pos = skip_horizontal_space(text, arrow + 2U, cursor.end);
            if (pos >= cursor.end || text[pos] != '"') {
                report(result, cursor.number, "edge declaration without a quoted target id");
                return;
            }
            auto target_close = find_closing_quote(text, pos, cursor.end);
            if (target_close == npos) {
                report(result, cursor.number, "unterminated edge target id");
                return;
            }
            auto bracket = skip_horizontal_space(text, target_close + 1U, cursor.end);
            if (bracket >= cursor.end || text[bracket] != '[') {
                report(result, cursor.number, "expected '[' after edge target id");
                return;
            }
            auto block = scan_attribute_block(text, bracket + 1U, cursor.end);
            if (!block) {
                report(result, cursor.number, "edge attribute block is not terminated on its line");
                return;
            }

            auto source = inner_id(text, start, source_close);
            auto target = inner_id(text, pos, target_close);
            if (source.empty() || target.empty()) {
                report(result, cursor.number, "edge declaration with an empty endpoint id");
                return;
            }

            auto line_text = text.substr(start, cursor.end - start);
            result.declarations.push_back(
                    declaration{
                            .kind = declaration_kind::edge,
                            .id = source,
                            .target_id = target,
                            .attr_text = utils::trim_right_ascii(
                                    text.substr(bracket + 1U, block->close_bracket - bracket - 1U)),
                            .raw_text = utils::trim_right_ascii(line_text),
                            .line = cursor.number});
        }

        // Returns the index of the terminating ';' on success.
        static std::optional<size_t> scan_node(
                scan_result& result, const line_cursor& cursor, size_t start, size_t id_close) {
            const auto& text = cursor.text;
            auto bracket = skip_horizontal_space(text, id_close + 1U, cursor.end);
            if (bracket >= cursor.end || text[bracket] != '[') {
                report(result, cursor.number, "expected '[' after node id");
                return std::nullopt;
            }
            auto id = inner_id(text, start, id_close);
            if (id.empty()) {
                report(result, cursor.number, "node declaration with an empty id");
                return std::nullopt;
            }
            auto block = scan_attribute_block(text, bracket + 1U, text.size());
            if (!block) {
                report(result, cursor.number, "unterminated attribute block for node \"{}\""_format(id));
                return std::nullopt;
            }

            result.declarations.push_back(
                    declaration{
                            .kind = declaration_kind::node,
                            .id = id,
                            .attr_text = utils::trim_right_ascii(
                                    text.substr(bracket + 1U, block->close_bracket - bracket - 1U)),
                            .raw_text = text.substr(start, block->semicolon + 1U - start),
                            .line = cursor.number});
            return block->semicolon;
        }

    }  // namespace detail

    scan_result scan_declarations(std::string_view text) {
        scan_result result{};
        detail::line_cursor cursor{.text = text, .begin = 0U, .end = 0U, .number = 1U};

        while (!cursor.at_end()) {
            cursor.load();
            auto line = text.substr(cursor.begin, cursor.end - cursor.begin);
            auto first = line.find_first_not_of(" \t\r\f\v");
            if (first == detail::npos || line[first] != '"') {
                cursor.next_line();
                continue;
            }

            auto start = cursor.begin + first;
            auto id_close = detail::find_closing_quote(text, start, cursor.end);
            if (id_close == detail::npos) {
                detail::report(result, cursor.number, "unterminated quoted id");
                cursor.next_line();
                continue;
            }

            auto rest = text.substr(id_close + 1U, cursor.end - id_close - 1U);
            auto arrow = rest.find("->"sv);
            auto bracket = rest.find('[');
            if (arrow != detail::npos && (bracket == detail::npos || arrow < bracket)) {
                detail::scan_edge(result, cursor, start, id_close, id_close + 1U + arrow);
                cursor.next_line();
                continue;
            }

            auto semicolon = detail::scan_node(result, cursor, start, id_close);
            if (!semicolon) {
                // resume on the line after the failed declaration's start
                cursor.next_line();
                continue;
            }

            // skip the rest of the line holding the terminating ';'
            auto consumed_lines = detail::count_newlines(text, cursor.begin, *semicolon);
            auto next = text.find('\n', *semicolon);
            cursor.begin = (next == detail::npos) ? text.size() : next + 1U;
            cursor.number += consumed_lines + 1U;
        }

        return result;
    }

}  // namespace cpgslice::graph
