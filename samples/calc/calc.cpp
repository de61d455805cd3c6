// sprout - Packrat PEG engine with extensible syntax trees in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <sprout/sprout.hpp>
#include <sprout/iostream.hpp>

#include <array>
#include <cstdlib>

namespace samples::calc {

using namespace sprout::language;

std::array<double, 26> variables{};

[[nodiscard]] std::size_t variable_index(syntax_node const& n)
{
	return static_cast<std::size_t>(n.text_value().front() - 'a');
}

[[nodiscard]] double apply(char op, double l, double r)
{
	switch (op) {
		case '*': return l * r;
		case '/': return l / r;
		case '+': return l + r;
		case '-': return l - r;
		default: throw sprout::sprout_error{std::string{"unknown operator '"} + op + "'"};
	}
}

// "operand (operator blank operand)*" folded left to right.
trait const left_fold = trait{"left_fold"}.define("value", [](syntax_node const& n) {
	auto result = n.element(0).get<double>("value");
	for (auto const& step : n.element(1).elements())
		result = apply(step->element(0).text_value().front(), result, step->element(2).get<double>("value"));
	return result;
});

[[nodiscard]] sprout::parser make_parser()
{
	grammar g;
	auto const blank = g.nonterminal("blank");
	auto const digit = g.nonterminal("digit");
	auto const letter = g.nonterminal("letter");
	auto number = g.nonterminal("number");
	auto identifier = g.nonterminal("identifier");
	auto const value = g.nonterminal("value");
	auto const product = g.nonterminal("product");
	auto const sum = g.nonterminal("sum");
	auto const expr = g.nonterminal("expr");

	auto command = ("exit"_t | "quit"_t) > blank;
	command.define("execute", [](syntax_node const&) { return false; });
	auto print = sequence({expr});
	print.define("execute", [](syntax_node const& n) {
		std::cout << n.element(0).get<double>("value") << "\n";
		return true;
	});
	auto statement = blank > (command | print);
	statement.define("execute", [](syntax_node const& n) { return n.element(1).get<bool>("execute"); });
	g.declare_rule("statement", statement);

	g.declare_rule(blank, *(" "_t | "\t"_t));
	g.declare_rule(digit, "0"_t | "1"_t | "2"_t | "3"_t | "4"_t | "5"_t | "6"_t | "7"_t | "8"_t | "9"_t);
	std::vector<expression> letters;
	for (char c = 'a'; c <= 'z'; ++c)
		letters.emplace_back(std::string_view{&c, 1});
	g.declare_rule(letter, choice(std::move(letters)));

	auto fraction = "."_t > +digit;
	g.declare_rule(number, +digit > ~fraction > blank);
	number.define("value", [](syntax_node const& n) { return std::stod(std::string{n.text_value()}); });
	g.declare_rule(identifier, letter > blank);
	identifier.define("index", [](syntax_node const& n) { return variable_index(n); });

	auto variable = identifier > !"="_t;
	variable.define("value", [](syntax_node const& n) { return variables.at(n.element(0).get<std::size_t>("index")); });
	auto group = "("_t > blank > expr > ")"_t > blank;
	group.define("value", [](syntax_node const& n) { return n.element(2).get<double>("value"); });
	g.declare_rule(value, number | variable | group);

	auto product_tail = *(("*"_t | "/"_t) > blank > value);
	auto product_fold = value > product_tail;
	product_fold.extend(left_fold);
	g.declare_rule(product, product_fold);

	auto sum_tail = *(("+"_t | "-"_t) > blank > product);
	auto sum_fold = product > sum_tail;
	sum_fold.extend(left_fold);
	g.declare_rule(sum, sum_fold);

	auto assignment = identifier > "="_t > blank > sum;
	assignment.define("value", [](syntax_node const& n) {
		return variables.at(n.element(0).get<std::size_t>("index")) = n.element(3).get<double>("value");
	});
	g.declare_rule(expr, assignment | sum);

	return g.new_parser();
}

} // namespace samples::calc

int main()
try {
	auto const parser = samples::calc::make_parser();
	bool const interactive = sprout::stdin_isatty();
	std::string line;
	for (;;) {
		if (interactive)
			std::cout << "> " << std::flush;
		if (!sprout::readsource(std::cin, line, sprout::source_options::interactive))
			break;
		while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
			line.pop_back();
		if (line.find_first_not_of(" \t") == std::string::npos)
			continue;
		auto const result = parser.parse(line);
		if (!result) {
			std::cerr << "SYNTAX ERROR at " << result.furthest_failure_position() << "\n";
			continue;
		}
		if (!result.get<bool>("execute"))
			break;
	}
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
