#include "cpgslice/graph.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace cpgslice::graph {
    namespace detail {

        static constexpr bool is_separator(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ',';
        }

        static constexpr bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
        }

        static constexpr bool is_key_start(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }

        static constexpr bool is_key_char(char c) {
            return is_key_start(c) || (c >= '0' && c <= '9');
        }

        class attribute_decoder {
          public:
            attribute_decoder(std::string_view text, std::span<const std::string_view> keys, bool filtered)
                    : text_{text}, keys_{keys}, filtered_{filtered} {}

            decoded_attributes run() {
                while (true) {
                    skip_while(is_separator);
                    if (pos_ >= text_.size()) {
                        break;
                    }
                    if (!is_key_start(text_[pos_])) {
                        skip_fragment();
                        continue;
                    }

                    auto key_begin = pos_;
                    while (pos_ < text_.size() && is_key_char(text_[pos_])) {
                        ++pos_;
                    }
                    auto key = text_.substr(key_begin, pos_ - key_begin);

                    skip_while(is_space);
                    if (pos_ >= text_.size() || text_[pos_] != '=') {
                        // key with no '='
                        ++result_.skipped_fragments;
                        continue;
                    }
                    ++pos_;
                    skip_while(is_space);

                    std::string value{};
                    if (pos_ < text_.size() && text_[pos_] == '"') {
                        if (!read_quoted(value)) {
                            ++result_.skipped_fragments;
                            break;
                        }
                    }
                    else {
                        auto value_begin = pos_;
                        while (pos_ < text_.size() && !is_separator(text_[pos_]) && text_[pos_] != ']') {
                            ++pos_;
                        }
                        value.assign(text_.substr(value_begin, pos_ - value_begin));
                    }

                    store(key, std::move(value));
                }
                return std::move(result_);
            }

          private:
            template <typename Pred>
            void skip_while(Pred pred) {
                while (pos_ < text_.size() && pred(text_[pos_])) {
                    ++pos_;
                }
            }

            // Drops an unrecognized run up to the next separator. A run opening
            // with a quote is dropped through its closing quote.
            void skip_fragment() {
                ++result_.skipped_fragments;
                if (text_[pos_] == '"') {
                    std::string ignored{};
                    if (!read_quoted(ignored)) {
                        pos_ = text_.size();
                    }
                    return;
                }
                while (pos_ < text_.size() && !is_separator(text_[pos_])) {
                    ++pos_;
                }
            }

            // `pos_` is on the opening quote. Returns false when the string is
            // never closed.
            bool read_quoted(std::string& out) {
                ++pos_;
                while (pos_ < text_.size()) {
                    auto c = text_[pos_++];
                    if (c == '"') {
                        return true;
                    }
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }
                    if (pos_ >= text_.size()) {
                        break;
                    }
                    auto escaped = text_[pos_++];
                    switch (escaped) {
                        case 'n':
                            out.push_back('\n');
                            break;
                        case 't':
                            out.push_back('\t');
                            break;
                        default:
                            out.push_back(escaped);
                            break;
                    }
                }
                return false;
            }

            void store(std::string_view key, std::string value) {
                if (filtered_ && std::ranges::find(keys_, key) == keys_.end()) {
                    return;
                }
                if (auto it = result_.values.find(key); it != result_.values.end()) {
                    it->second = std::move(value);
                    return;
                }
                result_.values.emplace(std::string{key}, std::move(value));
            }

            std::string_view text_;
            std::span<const std::string_view> keys_;
            bool filtered_;
            size_t pos_{0U};
            decoded_attributes result_{};
        };

    }  // namespace detail

    decoded_attributes parse_attributes(std::string_view attr_text) {
        return detail::attribute_decoder{attr_text, {}, false}.run();
    }

    decoded_attributes parse_attributes(std::string_view attr_text, std::span<const std::string_view> keys) {
        return detail::attribute_decoder{attr_text, keys, true}.run();
    }

}  // namespace cpgslice::graph
