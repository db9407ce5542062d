#pragma once
// Correction Engine: ordered regex substitution from a context's rules
//
// Rules run in the order they are stored; each one sees the output of the
// one before. A rule that does not compile is logged and skipped.
// Input longer than MAX_CORRECTION_INPUT is refused, not truncated.
// ^ and $ anchor at line boundaries.

#include "context_store.hpp"
#include <iostream>
#include <regex>
#include <string>

namespace niyama {

// Rule files carry group references as \1 or \g<1>; the regex engine
// wants $1. A literal '$' must be written $$ for the engine.
inline std::string translate_replacement(const std::string& replacement) {
    std::string out;
    out.reserve(replacement.size());

    for (size_t i = 0; i < replacement.size(); ++i) {
        char c = replacement[i];
        if (c == '$') {
            out += "$$";
            continue;
        }
        if (c != '\\' || i + 1 == replacement.size()) {
            out += c;
            continue;
        }

        char next = replacement[i + 1];
        if (next >= '0' && next <= '9') {
            // \1 .. \99
            size_t j = i + 1;
            std::string digits;
            while (j < replacement.size() && digits.size() < 2 &&
                   replacement[j] >= '0' && replacement[j] <= '9') {
                digits += replacement[j++];
            }
            out += (digits == "0" ? std::string("$&") : "$" + digits);
            i = j - 1;
        } else if (next == 'g' && i + 2 < replacement.size() && replacement[i + 2] == '<') {
            // \g<1>
            size_t close = replacement.find('>', i + 3);
            std::string group = close == std::string::npos ? "" : replacement.substr(i + 3, close - i - 3);
            bool numeric = !group.empty() &&
                           group.find_first_not_of("0123456789") == std::string::npos;
            if (numeric) {
                out += (group == "0" ? std::string("$&") : "$" + group);
                i = close;
            } else {
                out += c;
            }
        } else if (next == 'n') {
            out += '\n';
            ++i;
        } else if (next == 't') {
            out += '\t';
            ++i;
        } else if (next == '\\') {
            out += '\\';
            ++i;
        } else {
            out += c;
        }
    }
    return out;
}

// std::regex recurses once per character a repeat consumes. Past this size
// a rule like "^(.*)$" can exhaust the stack.
constexpr size_t MAX_CORRECTION_INPUT = 8 * 1024;

struct CorrectionResult {
    bool success = true;
    std::string text;
    std::string error;
};

// Apply one pattern. Throws std::regex_error if the pattern is invalid.
inline std::string apply_rule(const std::string& text, const CorrectionRule& rule) {
    std::regex re(rule.pattern, std::regex::ECMAScript | std::regex::multiline);
    return std::regex_replace(text, re, translate_replacement(rule.replacement));
}

inline CorrectionResult apply_corrections(const ContextDocument& doc, const std::string& text) {
    CorrectionResult result;
    result.text = text;

    auto rules = doc.corrections();
    if (rules.empty()) return result;

    if (text.size() > MAX_CORRECTION_INPUT) {
        result.success = false;
        result.error = "Text is " + std::to_string(text.size()) + " bytes; corrections accept at most " +
                       std::to_string(MAX_CORRECTION_INPUT);
        std::cerr << "[corrections] Rejected " << text.size() << " byte input for '"
                  << doc.tool_category << "'\n";
        return result;
    }

    for (const auto& rule : rules) {
        try {
            result.text = apply_rule(result.text, rule);
        } catch (const std::regex_error& e) {
            std::cerr << "[corrections] Error in regex pattern " << rule.name
                      << " (" << rule.pattern << "): " << e.what() << "\n";
        }
    }
    return result;
}

// Resolve the tool's context and apply its rules; unknown tools pass through.
inline CorrectionResult apply_corrections(const ContextStore& store,
                                          const std::string& tool_id,
                                          const std::string& text) {
    auto doc = store.get_by_tool(tool_id);
    if (!doc) return {true, text, ""};
    return apply_corrections(*doc, text);
}

} // namespace niyama
