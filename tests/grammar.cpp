// sprout - Packrat PEG engine with extensible syntax trees in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <sprout/sprout.hpp>

#undef NDEBUG
#include <cassert>
#include <iostream>
#include <optional>

using namespace std::string_view_literals;

template <class Error, class Fn>
bool throws(Fn&& fn)
{
	try {
		fn();
	} catch (Error const&) {
		return true;
	}
	return false;
}

void test_nonterminal_placeholder_identity()
{
	using namespace sprout::language;
	grammar g;
	auto const a1 = g.nonterminal("a");
	auto const a2 = g.nonterminal("a");
	auto const b = g.nonterminal("b");
	assert(a1 == a2);
	assert(a1 != b);
	assert(a1.is_nonterminal());
	assert(a1.rule_name() == "a"sv);
	assert(a1.describe() == "a");
	assert(!"a"_t.is_nonterminal());
	assert("a"_t.rule_name().empty());
	auto const a3 = g.declare_rule("a", "x"_t);
	assert(a3 == a1);
}

void test_duplicate_rule_rejected()
{
	using namespace sprout::language;
	grammar g;
	g.declare_rule("foo", "foo"_t);
	assert(throws<sprout::duplicate_rule_error>([&] { g.declare_rule("foo", "bar"_t); }));
	assert(throws<sprout::duplicate_rule_error>([&] { g.declare_rule(g.nonterminal("foo"), "bar"_t); }));
	assert(throws<sprout::grammar_error>([&] { g.rule("foo", "baz"_t); }));
	auto const p = g.new_parser();
	assert(p.parse("foo"));
	assert(!p.parse("bar"));
}

void test_empty_grammar()
{
	using namespace sprout::language;
	grammar g;
	assert(throws<sprout::bad_grammar>([&] { (void)g.new_parser(); }));
	(void)g.nonterminal("only_referenced");
	assert(throws<sprout::bad_grammar>([&] { (void)g.new_parser(); }));
	assert(throws<sprout::undefined_rule_error>([&] { (void)g.new_parser("only_referenced"); }));
	assert(throws<sprout::undefined_rule_error>([&] { (void)g.new_parser("never_mentioned"); }));
}

void test_undefined_rules()
{
	using namespace sprout::language;
	{
		grammar g;
		g.declare_rule("s", "a"_t > g.nonterminal("missing"));
		assert(throws<sprout::undefined_rule_error>([&] { (void)g.new_parser(); }));
		assert(g.frozen());
	}
	{
		grammar g;
		g.declare_rule("s", "a"_t);
		g.declare_rule("t", g.nonterminal("missing"));
		auto const p = g.new_parser();
		assert(p.parse("a"));
		assert(throws<sprout::undefined_rule_error>([&] { (void)g.new_parser("t"); }));
	}
	{
		grammar g;
		g.declare_rule("s", "a"_t);
		assert(g.resolve("s").valid());
		assert(throws<sprout::undefined_rule_error>([&] { (void)g.resolve("missing"); }));
		(void)g.nonterminal("pending");
		assert(throws<sprout::undefined_rule_error>([&] { (void)g.resolve("pending"); }));
		assert(g.has_rule("s"));
		assert(!g.has_rule("pending"));
		assert(!g.has_rule("missing"));
	}
}

void test_default_start_rule()
{
	using namespace sprout::language;
	grammar g;
	auto const item = g.nonterminal("item");
	g.declare_rule("list", item > *(","_t > item));
	g.declare_rule(item, "x"_t);
	auto const names = g.rule_names();
	assert(names.size() == 2);
	assert(names[0] == "list"sv);
	assert(names[1] == "item"sv);
	auto const p = g.new_parser();
	assert(p.start_rule_name() == "list"sv);
	assert(p.parse("x,x,x"));
	auto const q = g.new_parser("item");
	assert(q.start_rule_name() == "item"sv);
	assert(q.parse("x"));
	assert(!q.parse("x,x"));
}

void test_frozen_grammar()
{
	using namespace sprout::language;
	grammar g;
	auto const s = g.nonterminal("s");
	g.declare_rule(s, "a"_t);
	assert(!g.frozen());
	auto const p = g.new_parser();
	assert(g.frozen());
	assert(throws<sprout::frozen_grammar_error>([&] { g.declare_rule("t", "b"_t); }));
	assert(throws<sprout::frozen_grammar_error>([&] { (void)g.nonterminal("t"); }));
	assert(throws<sprout::frozen_grammar_error>([&] { g.declare_rule(s, "b"_t); }));
	assert(g.nonterminal("s") == s);
	auto const q = g.new_parser();
	assert(q.parse("a"));
	assert(p.parse("a"));
}

void test_resolve_returns_body()
{
	using namespace sprout::language;
	grammar g;
	auto const body = "a"_t | "b"_t;
	g.declare_rule("s", body);
	assert(g.resolve("s") == body);
}

void test_parsing_rule_objects()
{
	using namespace sprout::language;
	grammar g;
	auto const foo = g.nonterminal("foo");
	parsing_rule const r{foo, "foo"_t};
	assert(r.name() == "foo"sv);
	assert(r.nonterminal() == foo);
	g.add_rule(r);
	g.add_rule(g.nonterminal("bar"), "bar"_t);
	assert(throws<sprout::duplicate_rule_error>([&] { g.add_rule(r); }));
	assert(throws<sprout::bad_expression>([&] { parsing_rule{"foo"_t, "foo"_t}; }));
	assert(throws<sprout::bad_expression>([&] { parsing_rule{foo, expression{}}; }));

	grammar other;
	assert(throws<sprout::bad_expression>([&] { other.add_rule(r); }));
	assert(throws<sprout::bad_expression>([&] { other.declare_rule("x", expression{}); }));

	auto const p = g.new_parser();
	assert(p.parse("foo"));
	assert(g.new_parser("bar").parse("bar"));
}

void test_builder_form()
{
	using namespace sprout::language;
	grammar g{[](grammar& self) {
		self.rule("foo", self.exp("foo"));
	}};
	auto const p = g.new_parser();
	assert(!p.parse("bar"));
	assert(p.parse("foo"));
}

void test_invalid_expressions()
{
	using namespace sprout::language;
	grammar g;
	g.declare_rule("s", sequence({"a"_t, expression{}}));
	assert(throws<sprout::bad_expression>([&] { (void)g.new_parser(); }));
	assert(throws<sprout::bad_expression>([&] { (void)expression{}.body(); }));
	assert(throws<sprout::bad_expression>([&] { expression{}.define("x", [](syntax_node const&) { return 1; }); }));
}

void test_moved_grammar()
{
	using namespace sprout::language;
	grammar g;
	auto const s = g.nonterminal("s");
	g.declare_rule(s, "a"_t);
	grammar h{std::move(g)};
	assert(throws<sprout::bad_grammar>([&] { g.declare_rule("t", "b"_t); })); // NOLINT(bugprone-use-after-move)
	assert(throws<sprout::bad_grammar>([&] { (void)g.new_parser(); })); // NOLINT(bugprone-use-after-move)
	assert(h.nonterminal("s") == s);
	assert(h.new_parser().parse("a"));
}

void test_parser_outlives_grammar()
{
	using namespace sprout::language;
	std::optional<parser> p;
	{
		grammar g;
		auto const x = g.nonterminal("x");
		g.declare_rule("s", "("_t > x > ")"_t);
		g.declare_rule(x, "x"_t | g.nonterminal("s"));
		p.emplace(g.new_parser());
	}
	assert(p->parse("((x))"));
	assert(!p->parse("((x)"));
}

int main()
{
	try {
		test_nonterminal_placeholder_identity();
		test_duplicate_rule_rejected();
		test_empty_grammar();
		test_undefined_rules();
		test_default_start_rule();
		test_frozen_grammar();
		test_resolve_returns_body();
		test_parsing_rule_objects();
		test_builder_form();
		test_invalid_expressions();
		test_moved_grammar();
		test_parser_outlives_grammar();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	}
	return 0;
}
