// sprout - Packrat PEG engine with extensible syntax trees in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <sprout/sprout.hpp>

#undef NDEBUG
#include <cassert>
#include <iostream>

using namespace std::string_view_literals;

void test_cursor()
{
	sprout::cursor const c{"foobar"sv, 0};
	assert(c.index() == 0);
	assert(!c.at_end());
	assert(c.starts_with("foo"sv));
	assert(!c.starts_with("bar"sv));
	assert(c.starts_with(""sv));
	auto const d = c.advance(3);
	assert(d.index() == 3);
	assert(d.remaining() == "bar"sv);
	assert(d.starts_with("bar"sv));
	assert(!d.starts_with("barx"sv));
	assert(c.index() == 0); // advance yields a new cursor
	auto const e = d.advance(3);
	assert(e.at_end());
	assert(e.remaining().empty());
	assert(!e.starts_with("b"sv));
	assert(e.starts_with(""sv));
	assert(d.subject() == "foobar"sv);
}

void test_single_terminal_rule()
{
	using namespace sprout::language;
	grammar g;
	g.declare_rule("foo", terminal("foo"));
	auto const p = g.new_parser();

	auto const r1 = p.parse("foo");
	assert(r1.success());
	assert(r1->text_value() == "foo"sv);
	assert(r1->start_offset() == 0);
	assert(r1->end_offset() == 3);
	assert(r1->rule_name() == "foo"sv);

	auto const r2 = p.parse("foox");
	assert(r2.failure());
	assert(r2.furthest_failure_index() == 3);

	auto const r3 = p.parse("");
	assert(!r3);
	assert(r3.furthest_failure_index() == 0);

	auto const r4 = p.parse("fo");
	assert(!r4);
	assert(r4.furthest_failure_index() == 0);

	auto const r5 = p.parse("bar");
	assert(!r5);
	assert(r5.furthest_failure_index() == 0);
}

void test_terminal_node_shape()
{
	using namespace sprout::language;
	grammar g;
	auto const word = "abc"_t;
	g.declare_rule("s", word);
	auto const p = g.new_parser();
	auto const r = p.parse("abc");
	assert(r);
	auto const& root = r.root();
	assert(root.is_nonterminal());
	assert(root.elements().empty());
	assert(root.inner() != nullptr);
	assert(root.inner()->origin() == word);
	assert(root.inner()->elements().empty());
	assert(!root.inner()->is_nonterminal());
	assert(root.inner()->text_value() == "abc"sv);
	assert(root.size() == 3);
	assert(!root.empty());
}

void test_empty_terminal()
{
	using namespace sprout::language;
	grammar g;
	g.declare_rule("empty", ""_t);
	auto const p = g.new_parser();
	auto const r1 = p.parse("");
	assert(r1);
	assert(r1->empty());
	assert(r1->text_value().empty());
	auto const r2 = p.parse("x");
	assert(!r2);
	assert(r2.furthest_failure_index() == 0);
}

void test_implicit_terminals()
{
	using namespace sprout::language;
	expression const a = "a";
	expression const b = std::string_view{"bb"};
	assert(std::holds_alternative<sprout::terminal_expression>(a.body()));
	assert(std::get<sprout::terminal_expression>(b.body()).literal == "bb");
	assert(grammar::exp("c").describe() == "\"c\"");

	grammar g;
	g.declare_rule("s", sequence({a, b, "c"}));
	auto const p = g.new_parser();
	assert(p.parse("abbc"));
	assert(!p.parse("abc"));
}

void test_multibyte_terminal()
{
	using namespace sprout::language;
	grammar g;
	g.declare_rule("s", terminal("\xC3\xA9t\xC3\xA9"));
	auto const p = g.new_parser();
	auto const r = p.parse("\xC3\xA9t\xC3\xA9");
	assert(r);
	assert(r->size() == 5);
	auto const f = p.parse("\xC3\xA9t\xC3");
	assert(!f);
	assert(f.furthest_failure_index() == 0);
}

void test_describe_escapes()
{
	using namespace sprout::language;
	assert(terminal("a\"b").describe() == R"("a\"b")");
	assert(terminal("\n\t").describe() == R"("\n\t")");
	assert(terminal("\\").describe() == R"("\\")");
	assert(expression{}.describe() == "<invalid>");
}

int main()
{
	try {
		test_cursor();
		test_single_terminal_rule();
		test_terminal_node_shape();
		test_empty_terminal();
		test_implicit_terminals();
		test_multibyte_terminal();
		test_describe_escapes();
	} catch (std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return -1;
	}
	return 0;
}
