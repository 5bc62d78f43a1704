#pragma once
#include <string>
#include <vector>

namespace names {

// Each step below is one pure text transformation; normalize_name runs them
// in order. They are exposed so they can be exercised in isolation.

// "Roderic (Rick)Taylor" -> "Roderic Taylor"
std::string strip_parentheticals(const std::string& s);

// "Nguyen, Clare" -> "Nguyen  Clare"
std::string commas_to_spaces(const std::string& s);

// "Christopher N.Bradley" -> "Christopher N. Bradley"
std::string split_glued_initials(const std::string& s);

// "MorganMcKnight" -> {"Morgan", "Mc", "Knight"}; text before the first
// capital is dropped
std::vector<std::string> split_capitalized(const std::string& word);

// {"Morgan", "Mc", "Knight"} -> {"Morgan", "McKnight"}
std::vector<std::string> merge_name_prefixes(const std::vector<std::string>& parts);

// single whitespace-free token -> name pieces, case preserved
// "RodericTaylor" -> {"Roderic", "Taylor"}, "rodericTaylor" -> {"roderic", "Taylor"}
std::vector<std::string> split_glued_name(const std::string& token);

// lowercase comparable tokens, middle initials removed; empty if unusable
std::vector<std::string> normalize_name(const std::string& raw);

}  // namespace names
