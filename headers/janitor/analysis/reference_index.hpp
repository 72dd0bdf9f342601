//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_REFERENCE_INDEX_HPP
#define JANITOR_REFERENCE_INDEX_HPP

/**
 * @file reference_index.hpp
 * @brief Workspace-wide record of which files use which names.
 *
 * The index is what turns "file-only" classification into "workspace"
 * classification: it answers whether a symbol declared in one file is used
 * from any other file. Occurrences are resolved through the symbol
 * provider. An occurrence that resolves to a specific file only counts for
 * that file; one the provider could not resolve counts for every file
 * declaring the name, which errs toward keeping code alive.
 */

#include "janitor/syntax/symbol_provider.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace janitor::analysis {

    class ReferenceIndex {
    public:
        struct Occurrence {
            std::string file;
            syntax::Span span;
            /// Files the occurrence resolved to; empty when unresolved.
            std::set<std::string> targets;
        };

        /**
         * Records every reference, import binding and re-exported name of
         * @p tree, replacing what was recorded for that file before.
         */
        void add_file(const syntax::SyntaxTree& tree, const syntax::ISymbolProvider& provider);

        void remove_file(const std::string& file);

        /**
         * True when @p name, declared in @p declaring_file, is used by any
         * other file.
         */
        [[nodiscard]] bool is_referenced_externally(std::string_view name,
                                                    std::string_view declaring_file) const;

        /**
         * True when any file other than @p file mentions @p name, wherever
         * it resolves. Used for members, which resolve through types the
         * index does not track.
         */
        [[nodiscard]] bool is_name_used_elsewhere(std::string_view name, std::string_view file) const;

        /**
         * Other files using @p name from @p declaring_file, sorted.
         */
        [[nodiscard]] std::vector<std::string> referencing_files(std::string_view name,
                                                                 std::string_view declaring_file) const;

        /**
         * Files other than @p file with any occurrence of @p name, resolved
         * or not, sorted.
         */
        [[nodiscard]] std::vector<std::string> files_mentioning(std::string_view name,
                                                                std::string_view file) const;

        [[nodiscard]] bool contains_file(std::string_view file) const;
        [[nodiscard]] std::size_t file_count() const noexcept { return by_file_.size(); }
        [[nodiscard]] std::size_t occurrence_count(std::string_view name) const;

    private:
        static bool counts_for(const Occurrence& occurrence, std::string_view declaring_file);

        std::map<std::string, std::vector<Occurrence>, std::less<>> by_name_;
        std::map<std::string, std::set<std::string>, std::less<>> by_file_;
    };

}  // namespace janitor::analysis

#endif //JANITOR_REFERENCE_INDEX_HPP
