// sprout - Packrat PEG engine with extensible syntax trees in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SPROUT_INCLUDE_SPROUT_ERROR_HPP
#define SPROUT_INCLUDE_SPROUT_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sprout {

class sprout_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class grammar_error : public sprout_error { public: explicit grammar_error(std::string const& s) : sprout_error{s} {} };
class bad_grammar : public grammar_error { public: bad_grammar() : grammar_error{"invalid or empty grammar"} {} };
class bad_expression : public grammar_error { public: explicit bad_expression(std::string const& s = "invalid or empty parsing expression") : grammar_error{s} {} };
class frozen_grammar_error : public grammar_error { public: frozen_grammar_error() : grammar_error{"grammar cannot be modified once a parser has been created from it"} {} };
class duplicate_rule_error : public grammar_error { public: explicit duplicate_rule_error(std::string_view name) : grammar_error{"rule '" + std::string{name} + "' is already declared"} {} };
class undefined_rule_error : public grammar_error { public: explicit undefined_rule_error(std::string_view name) : grammar_error{"rule '" + std::string{name} + "' is referenced but never declared"} {} };
class left_recursion_error : public grammar_error { public: left_recursion_error(std::string_view name, std::size_t index) : grammar_error{"rule '" + std::string{name} + "' re-entered at index " + std::to_string(index) + " without consuming input"} {} };
class recursion_limit_error : public sprout_error { public: recursion_limit_error() : sprout_error{"nonterminal call depth exceeds parser limit"} {} };
class undefined_accessor_error : public sprout_error { public: explicit undefined_accessor_error(std::string_view name) : sprout_error{"syntax node has no accessor named '" + std::string{name} + "'"} {} };
class bad_input : public sprout_error { public: bad_input() : sprout_error{"parser input is null"} {} };
class bad_result_access : public sprout_error { public: bad_result_access() : sprout_error{"failed parse result holds no syntax tree"} {} };

} // namespace sprout

#endif
