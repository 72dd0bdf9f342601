//
// Created by gregorian-rayne on 02/03/26.
//

#include "janitor/syntax/ignore_directives.hpp"

#include <cctype>
#include <string_view>

namespace janitor::syntax {

    namespace {

        constexpr std::string_view kMarker = "@janitor-ignore";

        enum class DirectiveTarget { SameLine, NextLine, File };

        std::optional<std::set<FindingKind>> parse_kinds(std::string_view rest) {
            std::set<FindingKind> kinds;
            std::string token;
            bool listed = false;

            auto flush = [&] {
                if (token.empty()) {
                    return;
                }
                listed = true;
                if (const auto kind = finding_kind_from_string(token)) {
                    kinds.insert(*kind);
                }
                token.clear();
            };

            for (const char c : rest) {
                if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
                    flush();
                } else if (c == '*') {
                    // end of a block comment
                    break;
                } else {
                    token += c;
                }
            }
            flush();

            // a list naming only unknown kinds suppresses nothing
            if (!listed) {
                return std::nullopt;
            }
            return kinds;
        }

    }  // namespace

    void IgnoreDirectives::merge(std::optional<KindFilter>& slot, KindFilter filter) {
        if (!slot) {
            slot = std::move(filter);
            return;
        }
        if (!slot->has_value() || !filter.has_value()) {
            *slot = std::nullopt;
            return;
        }
        (*slot)->insert(filter->begin(), filter->end());
    }

    bool IgnoreDirectives::matches(const KindFilter& filter, const FindingKind kind) {
        return !filter.has_value() || filter->contains(kind);
    }

    IgnoreDirectives IgnoreDirectives::parse(const std::vector<std::string>& lines) {
        IgnoreDirectives directives;

        for (std::size_t i = 0; i < lines.size(); ++i) {
            const std::string_view text = lines[i];
            const auto pos = text.find(kMarker);
            if (pos == std::string_view::npos) {
                continue;
            }

            auto rest = text.substr(pos + kMarker.size());
            DirectiveTarget target = DirectiveTarget::SameLine;
            if (rest.starts_with("-file")) {
                target = DirectiveTarget::File;
                rest.remove_prefix(5);
            } else if (rest.starts_with("-next")) {
                target = DirectiveTarget::NextLine;
                rest.remove_prefix(5);
            } else if (!rest.empty() && !std::isspace(static_cast<unsigned char>(rest.front()))) {
                continue;
            }

            auto filter = parse_kinds(rest);
            const int line = static_cast<int>(i) + 1;

            switch (target) {
                case DirectiveTarget::File:
                    merge(directives.file_, std::move(filter));
                    break;
                case DirectiveTarget::NextLine:
                case DirectiveTarget::SameLine: {
                    const int target_line = target == DirectiveTarget::NextLine ? line + 1 : line;
                    std::optional<KindFilter> slot;
                    if (const auto it = directives.lines_.find(target_line); it != directives.lines_.end()) {
                        slot = it->second;
                    }
                    merge(slot, std::move(filter));
                    directives.lines_.insert_or_assign(target_line, std::move(*slot));
                    break;
                }
            }
        }

        return directives;
    }

    bool IgnoreDirectives::suppresses_file(const FindingKind kind) const {
        return file_.has_value() && matches(*file_, kind);
    }

    bool IgnoreDirectives::suppresses(const FindingKind kind, const int line) const {
        if (suppresses_file(kind)) {
            return true;
        }
        const auto it = lines_.find(line);
        return it != lines_.end() && matches(it->second, kind);
    }

}  // namespace janitor::syntax
