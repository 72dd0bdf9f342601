//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_CANDIDATE_HPP
#define JANITOR_CANDIDATE_HPP

/**
 * @file candidate.hpp
 * @brief Raw, unclassified finding emitted by a detector.
 */

#include "janitor/syntax/syntax_tree.hpp"
#include "janitor/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace janitor::analysis {

    struct Candidate {
        FindingKind kind = FindingKind::UnusedImport;
        std::string file;
        std::string symbol_name;
        syntax::Span span;

        /// Kind of the declaration behind the candidate, if any.
        std::optional<syntax::DeclarationKind> declaration_kind;
        bool exported = false;
        bool default_export = false;
        std::vector<std::string> decorators;

        std::string message;
        std::vector<std::string> tags;
        /// Locations beyond the primary span (for example the other files
        /// of a cycle).
        std::vector<SourceLocation> related;
    };

}  // namespace janitor::analysis

#endif //JANITOR_CANDIDATE_HPP
