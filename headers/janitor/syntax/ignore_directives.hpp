//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_IGNORE_DIRECTIVES_HPP
#define JANITOR_IGNORE_DIRECTIVES_HPP

/**
 * @file ignore_directives.hpp
 * @brief In-source suppression comments.
 *
 * - `// @janitor-ignore-file [kinds]` suppresses findings anywhere in the file
 * - `// @janitor-ignore-next [kinds]` suppresses findings on the next line
 * - `// @janitor-ignore [kinds]` suppresses findings on the same line
 *
 * `kinds` is an optional comma separated list such as
 * `unused-import,dead-function`. Without it every kind is suppressed.
 * Unknown kind names match nothing, so a list of only unknown names
 * suppresses nothing.
 */

#include "janitor/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace janitor::syntax {

    class IgnoreDirectives {
    public:
        IgnoreDirectives() = default;

        /**
         * Scans source lines; line numbers are 1-based.
         */
        static IgnoreDirectives parse(const std::vector<std::string>& lines);

        [[nodiscard]] bool suppresses(FindingKind kind, int line) const;
        [[nodiscard]] bool suppresses_file(FindingKind kind) const;

        [[nodiscard]] bool empty() const noexcept { return !file_ && lines_.empty(); }

    private:
        /// nullopt means every kind.
        using KindFilter = std::optional<std::set<FindingKind>>;

        static void merge(std::optional<KindFilter>& slot, KindFilter filter);
        static bool matches(const KindFilter& filter, FindingKind kind);

        std::optional<KindFilter> file_;
        std::map<int, KindFilter> lines_;
    };

}  // namespace janitor::syntax

#endif //JANITOR_IGNORE_DIRECTIVES_HPP
