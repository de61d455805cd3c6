// sprout - Packrat PEG engine with extensible syntax trees in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef SPROUT_INCLUDE_SPROUT_SPROUT_HPP
#define SPROUT_INCLUDE_SPROUT_SPROUT_HPP

#include <sprout/detail.hpp>
#include <sprout/error.hpp>

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace sprout {

class cursor;
class expression;
class grammar;
class parse_result;
class parser;
class parsing_rule;
class syntax_node;
class trait;
struct match_failure;
struct parser_options;
struct syntax_position;
struct trace_event;
struct terminal_expression;
struct nonterminal_expression;
struct sequence_expression;
struct choice_expression;
struct zero_or_more_expression;
struct one_or_more_expression;
struct optional_expression;
struct and_predicate_expression;
struct not_predicate_expression;
namespace detail { struct expression_data; struct rule_table; class match_context; }
enum class trace_kind : std::uint_least8_t { enter, match, fail };
using node_ptr = std::shared_ptr<syntax_node const>;
using node_list = std::vector<node_ptr>;
using accessor = std::function<std::any(syntax_node const&)>;
using trace_handler = std::function<void(trace_event const&)>;
using outcome = std::variant<node_ptr, match_failure>;
using expression_variant = std::variant<terminal_expression, nonterminal_expression, sequence_expression, choice_expression, zero_or_more_expression, one_or_more_expression, optional_expression, and_predicate_expression, not_predicate_expression>;

template <class Fn> inline constexpr bool is_accessor_callable_v = std::is_invocable_v<std::decay_t<Fn> const&, syntax_node const&>;
template <class B> inline constexpr bool is_grammar_builder_v = std::is_invocable_v<std::decay_t<B>&, grammar&>;

struct syntax_position
{
	std::size_t line{0};
	std::size_t column{0};
	[[nodiscard]] constexpr bool operator==(syntax_position const& other) const noexcept { return line == other.line && column == other.column; }
	[[nodiscard]] constexpr bool operator!=(syntax_position const& other) const noexcept { return !(*this == other); }
	[[nodiscard]] constexpr bool operator<(syntax_position const& other) const noexcept { return line < other.line || (line == other.line && column < other.column); }
	[[nodiscard]] constexpr bool operator<=(syntax_position const& other) const noexcept { return !(other < *this); }
	[[nodiscard]] constexpr bool operator>(syntax_position const& other) const noexcept { return other < *this; }
	[[nodiscard]] constexpr bool operator>=(syntax_position const& other) const noexcept { return !(*this < other); }
};

class cursor
{
	std::string_view subject_;
	std::size_t index_{0};
public:
	constexpr cursor() noexcept = default;
	constexpr cursor(std::string_view s, std::size_t i) noexcept : subject_{s}, index_{(std::min)(i, s.size())} {}
	[[nodiscard]] constexpr std::string_view subject() const noexcept { return subject_; }
	[[nodiscard]] constexpr std::size_t index() const noexcept { return index_; }
	[[nodiscard]] constexpr std::string_view remaining() const noexcept { return std::string_view{subject_.data() + index_, subject_.size() - index_}; }
	[[nodiscard]] constexpr bool at_end() const noexcept { return index_ >= subject_.size(); }
	[[nodiscard]] constexpr bool starts_with(std::string_view literal) const noexcept { auto const rest = remaining(); return rest.size() >= literal.size() && rest.substr(0, literal.size()) == literal; }
	[[nodiscard]] constexpr cursor advance(std::size_t n) const noexcept { return cursor{subject_, index_ + n}; }
	[[nodiscard]] constexpr bool operator==(cursor const& other) const noexcept { return subject_.data() == other.subject_.data() && index_ == other.index_; }
	[[nodiscard]] constexpr bool operator!=(cursor const& other) const noexcept { return !(*this == other); }
};

struct match_failure
{
	std::size_t furthest{0};
};

struct trace_event
{
	trace_kind kind{trace_kind::enter};
	std::string_view rule;
	std::size_t index{0};
	std::size_t end{0};
	std::size_t depth{0};
};

struct parser_options
{
	static constexpr std::size_t default_max_call_depth{1024};
	static constexpr std::uint_least32_t default_tab_width{8};
	static constexpr std::uint_least32_t default_tab_alignment{8};
	std::size_t max_call_depth{default_max_call_depth};
	bool memoize{true};
	std::uint_least32_t tab_width{default_tab_width};
	std::uint_least32_t tab_alignment{default_tab_alignment};
	trace_handler tracer;
};

namespace detail {

template <class Fn>
[[nodiscard]] accessor make_accessor(Fn&& fn)
{
	using result_type = std::invoke_result_t<std::decay_t<Fn> const&, syntax_node const&>;
	if constexpr (std::is_void_v<result_type>) {
		return accessor{[f = std::forward<Fn>(fn)](syntax_node const& n) -> std::any { f(n); return std::any{}; }};
	} else {
		return accessor{[f = std::forward<Fn>(fn)](syntax_node const& n) -> std::any { return std::any{f(n)}; }};
	}
}

} // namespace detail

// Named bundle of computed accessors. Accessors defined directly on a trait
// take precedence over included traits, and later entries over earlier ones.
class trait
{
	std::string name_;
	std::vector<std::pair<std::string, accessor>> accessors_;
	std::vector<std::shared_ptr<trait const>> includes_;

public:
	trait() = default;
	explicit trait(std::string name) : name_{std::move(name)} {}
	[[nodiscard]] std::string const& name() const noexcept { return name_; }
	[[nodiscard]] bool empty() const noexcept { return accessors_.empty() && includes_.empty(); }

	template <class Fn, class = std::enable_if_t<is_accessor_callable_v<Fn>>>
	trait& define(std::string name, Fn&& fn)
	{
		accessors_.emplace_back(std::move(name), detail::make_accessor(std::forward<Fn>(fn)));
		return *this;
	}

	trait& include(trait const& other)
	{
		includes_.push_back(std::make_shared<trait const>(other));
		return *this;
	}

	[[nodiscard]] accessor const* find(std::string_view name) const noexcept
	{
		for (auto a = accessors_.crbegin(); a != accessors_.crend(); ++a)
			if (a->first == name)
				return &a->second;
		for (auto t = includes_.crbegin(); t != includes_.crend(); ++t)
			if (auto const* a = (*t)->find(name); a != nullptr)
				return a;
		return nullptr;
	}
};

class expression
{
	std::shared_ptr<detail::expression_data> data_;

	[[nodiscard]] detail::expression_data& data() const;

public:
	expression() noexcept = default;
	explicit expression(std::shared_ptr<detail::expression_data> d) noexcept : data_{std::move(d)} {}
	expression(char const* literal); // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	expression(std::string_view literal); // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	[[nodiscard]] bool valid() const noexcept { return data_ != nullptr; }
	[[nodiscard]] detail::expression_data const* identity() const noexcept { return data_.get(); }
	[[nodiscard]] expression_variant const& body() const;
	[[nodiscard]] bool is_nonterminal() const noexcept;
	[[nodiscard]] std::string_view rule_name() const noexcept;
	[[nodiscard]] bool extended() const noexcept;
	[[nodiscard]] accessor const* find(std::string_view name) const noexcept;
	[[nodiscard]] std::string describe() const;
	expression& extend(trait const& t);
	template <class Fn, class = std::enable_if_t<is_accessor_callable_v<Fn>>> expression& define(std::string name, Fn&& fn);
	[[nodiscard]] bool operator==(expression const& other) const noexcept { return data_ == other.data_; }
	[[nodiscard]] bool operator!=(expression const& other) const noexcept { return data_ != other.data_; }
};

struct terminal_expression { std::string literal; };
struct nonterminal_expression { std::string name; std::weak_ptr<detail::rule_table const> rules; std::size_t slot{0}; };
struct sequence_expression { std::vector<expression> elements; };
struct choice_expression { std::vector<expression> alternatives; };
struct zero_or_more_expression { expression inner; };
struct one_or_more_expression { expression inner; };
struct optional_expression { expression inner; };
struct and_predicate_expression { expression inner; };
struct not_predicate_expression { expression inner; };

namespace detail {

struct expression_data
{
	expression_variant body;
	std::vector<std::shared_ptr<trait>> traits;
	bool inline_trait_open{false};
	explicit expression_data(expression_variant b) : body{std::move(b)} {}
};

template <class E>
[[nodiscard]] inline expression make_expression(E&& e)
{
	return expression{std::make_shared<expression_data>(std::forward<E>(e))};
}

inline void describe_literal(std::string& out, std::string_view literal)
{
	out += '"';
	for (char const c : literal) {
		switch (c) {
			case '"': out += "\\\""; break;
			case '\\': out += "\\\\"; break;
			case '\n': out += "\\n"; break;
			case '\r': out += "\\r"; break;
			case '\t': out += "\\t"; break;
			default: out += c; break;
		}
	}
	out += '"';
}

inline void describe_expression(std::string& out, expression const& e);

inline void describe_list(std::string& out, std::vector<expression> const& children, std::string_view separator)
{
	out += '(';
	for (std::size_t i = 0; i < children.size(); ++i) {
		if (i > 0)
			out += separator;
		describe_expression(out, children[i]);
	}
	out += ')';
}

inline void describe_expression(std::string& out, expression const& e)
{
	if (!e.valid()) {
		out += "<invalid>";
		return;
	}
	std::visit([&out](auto const& x) {
		using X = std::decay_t<decltype(x)>;
		if constexpr (std::is_same_v<X, terminal_expression>) {
			describe_literal(out, x.literal);
		} else if constexpr (std::is_same_v<X, nonterminal_expression>) {
			out += x.name;
		} else if constexpr (std::is_same_v<X, sequence_expression>) {
			describe_list(out, x.elements, " ");
		} else if constexpr (std::is_same_v<X, choice_expression>) {
			if (x.alternatives.empty())
				out += "(/)";
			else
				describe_list(out, x.alternatives, " / ");
		} else if constexpr (std::is_same_v<X, zero_or_more_expression>) {
			describe_expression(out, x.inner);
			out += '*';
		} else if constexpr (std::is_same_v<X, one_or_more_expression>) {
			describe_expression(out, x.inner);
			out += '+';
		} else if constexpr (std::is_same_v<X, optional_expression>) {
			describe_expression(out, x.inner);
			out += '?';
		} else if constexpr (std::is_same_v<X, and_predicate_expression>) {
			out += '&';
			describe_expression(out, x.inner);
		} else if constexpr (std::is_same_v<X, not_predicate_expression>) {
			out += '!';
			describe_expression(out, x.inner);
		} else {
			static_assert(detail::always_false_v<X>, "non-exhaustive visitor!");
		}
	}, e.body());
}

} // namespace detail

inline expression::expression(char const* literal) : expression{(literal != nullptr) ? std::string_view{literal} : throw bad_expression{}} {}
inline expression::expression(std::string_view literal) : data_{std::make_shared<detail::expression_data>(terminal_expression{std::string{literal}})} {}

inline detail::expression_data& expression::data() const
{
	if (data_ == nullptr)
		throw bad_expression{};
	return *data_;
}

inline expression_variant const& expression::body() const
{
	return data().body;
}

inline bool expression::is_nonterminal() const noexcept
{
	return data_ != nullptr && std::holds_alternative<nonterminal_expression>(data_->body);
}

inline std::string_view expression::rule_name() const noexcept
{
	if (auto const* x = (data_ != nullptr) ? std::get_if<nonterminal_expression>(&data_->body) : nullptr; x != nullptr)
		return x->name;
	return std::string_view{};
}

inline bool expression::extended() const noexcept
{
	return data_ != nullptr && !data_->traits.empty();
}

inline accessor const* expression::find(std::string_view name) const noexcept
{
	if (data_ == nullptr)
		return nullptr;
	for (auto t = data_->traits.crbegin(); t != data_->traits.crend(); ++t)
		if (auto const* a = (*t)->find(name); a != nullptr)
			return a;
	return nullptr;
}

inline std::string expression::describe() const
{
	std::string result;
	detail::describe_expression(result, *this);
	return result;
}

inline expression& expression::extend(trait const& t)
{
	auto& d = data();
	d.traits.push_back(std::make_shared<trait>(t));
	d.inline_trait_open = false;
	return *this;
}

template <class Fn, class>
expression& expression::define(std::string name, Fn&& fn)
{
	auto& d = data();
	if (!d.inline_trait_open || d.traits.empty()) {
		d.traits.push_back(std::make_shared<trait>());
		d.inline_trait_open = true;
	}
	d.traits.back()->define(std::move(name), std::forward<Fn>(fn));
	return *this;
}

class syntax_node
{
	std::string_view subject_;
	std::size_t start_{0};
	std::size_t end_{0};
	node_list elements_;
	expression origin_;
	node_ptr inner_;
	std::vector<expression> extensions_;

	[[nodiscard]] accessor const* find_local(std::string_view name) const noexcept
	{
		for (auto x = extensions_.crbegin(); x != extensions_.crend(); ++x)
			if (auto const* a = x->find(name); a != nullptr)
				return a;
		return origin_.find(name);
	}

public:
	syntax_node(std::string_view subject, std::size_t start, std::size_t end, node_list elements, expression origin, node_ptr inner = nullptr)
		: subject_{subject}, start_{start}, end_{end}, elements_{std::move(elements)}, origin_{std::move(origin)}, inner_{std::move(inner)}
	{}

	// Same node, additionally carrying the traits of an enclosing expression
	// that passed it through unchanged.
	syntax_node(syntax_node const& base, expression extension)
		: syntax_node{base}
	{
		extensions_.push_back(std::move(extension));
	}

	[[nodiscard]] std::string_view subject() const noexcept { return subject_; }
	[[nodiscard]] std::size_t start_offset() const noexcept { return start_; }
	[[nodiscard]] std::size_t end_offset() const noexcept { return end_; }
	[[nodiscard]] std::size_t size() const noexcept { return end_ - start_; }
	[[nodiscard]] bool empty() const noexcept { return start_ == end_; }
	[[nodiscard]] std::string_view text_value() const noexcept { return std::string_view{subject_.data() + start_, end_ - start_}; }
	[[nodiscard]] node_list const& elements() const noexcept { return elements_; }
	[[nodiscard]] syntax_node const& element(std::size_t i) const { return *elements_.at(i); }
	[[nodiscard]] expression const& origin() const noexcept { return origin_; }
	[[nodiscard]] node_ptr const& inner() const noexcept { return inner_; }
	[[nodiscard]] bool is_nonterminal() const noexcept { return inner_ != nullptr; }
	[[nodiscard]] std::string_view rule_name() const noexcept { return origin_.rule_name(); }
	[[nodiscard]] std::vector<expression> const& extensions() const noexcept { return extensions_; }
	[[nodiscard]] bool has(std::string_view name) const noexcept { return find_local(name) != nullptr || (inner_ != nullptr && inner_->has(name)); }

	// Accessors attached to this node's expressions are called on this node,
	// otherwise the lookup falls through to the wrapped rule body.
	std::any call(std::string_view name) const
	{
		if (auto const* a = find_local(name); a != nullptr)
			return (*a)(*this);
		if (inner_ != nullptr)
			return inner_->call(name);
		throw undefined_accessor_error{name};
	}

	template <class T>
	[[nodiscard]] T get(std::string_view name) const
	{
		return std::any_cast<T>(call(name));
	}
};

namespace language {

[[nodiscard]] inline expression terminal(std::string_view literal) { return detail::make_expression(terminal_expression{std::string{literal}}); }
[[nodiscard]] inline expression sequence(std::vector<expression> elements) { return detail::make_expression(sequence_expression{std::move(elements)}); }
[[nodiscard]] inline expression choice(std::vector<expression> alternatives) { return detail::make_expression(choice_expression{std::move(alternatives)}); }
[[nodiscard]] inline expression zero_or_more(expression e) { return detail::make_expression(zero_or_more_expression{std::move(e)}); }
[[nodiscard]] inline expression one_or_more(expression e) { return detail::make_expression(one_or_more_expression{std::move(e)}); }
[[nodiscard]] inline expression optional(expression e) { return detail::make_expression(optional_expression{std::move(e)}); }
[[nodiscard]] inline expression and_predicate(expression e) { return detail::make_expression(and_predicate_expression{std::move(e)}); }
[[nodiscard]] inline expression not_predicate(expression e) { return detail::make_expression(not_predicate_expression{std::move(e)}); }

} // namespace language

namespace detail {

struct rule_slot
{
	std::string name;
	expression placeholder;
	expression body;
};

struct rule_table
{
	std::vector<rule_slot> slots;
	std::unordered_map<std::string, std::size_t> names;
	std::vector<std::size_t> declaration_order;
	bool frozen{false};

	[[nodiscard]] std::optional<std::size_t> find(std::string_view name) const
	{
		if (auto const n = names.find(std::string{name}); n != names.end())
			return n->second;
		return std::nullopt;
	}
};

// Per-call matching state: packrat memo table, the set of nonterminal
// invocations in progress, and the furthest failure seen so far.
class match_context
{
	// Outcomes computed under a predicate reported no failures, so they are
	// cached apart from outcomes computed outside one.
	struct call_key
	{
		expression_data const* expr;
		std::size_t index;
		bool predicated{false};
		[[nodiscard]] bool operator==(call_key const& other) const noexcept { return expr == other.expr && index == other.index && predicated == other.predicated; }
	};

	struct call_key_hash
	{
		[[nodiscard]] std::size_t operator()(call_key const& k) const noexcept
		{
			return hash_combine(hash_combine(std::hash<expression_data const*>{}(k.expr), std::hash<std::size_t>{}(k.index)), k.predicated ? 1U : 0U);
		}
	};

	std::string_view subject_;
	parser_options const& options_;
	std::unordered_map<call_key, outcome, call_key_hash> memo_;
	std::unordered_set<call_key, call_key_hash> active_;
	std::vector<expression> expected_;
	std::size_t furthest_{0};
	std::size_t call_depth_{0};
	std::size_t predicate_depth_{0};

	void note_failure(std::size_t index, expression const& e)
	{
		if (predicate_depth_ > 0)
			return;
		if (index > furthest_) {
			furthest_ = index;
			expected_.clear();
		}
		if (index == furthest_ && std::find(expected_.begin(), expected_.end(), e) == expected_.end())
			expected_.push_back(e);
	}

	void trace(trace_kind kind, std::string_view rule, std::size_t index, std::size_t end) const
	{
		if (options_.tracer)
			options_.tracer(trace_event{kind, rule, index, end, call_depth_});
	}

	[[nodiscard]] node_ptr make_node(expression const& e, std::size_t start, std::size_t end, node_list elements = {}) const
	{
		return std::make_shared<syntax_node const>(subject_, start, end, std::move(elements), e);
	}

	[[nodiscard]] outcome evaluate(expression const& e, expression_variant const& body, cursor const& c)
	{
		return std::visit([this, &e, &c](auto const& x) -> outcome {
			using X = std::decay_t<decltype(x)>;
			if constexpr (std::is_same_v<X, terminal_expression>) {
				return match_terminal(x, e, c);
			} else if constexpr (std::is_same_v<X, nonterminal_expression>) {
				return match_nonterminal(x, e, c);
			} else if constexpr (std::is_same_v<X, sequence_expression>) {
				return match_sequence(x, e, c);
			} else if constexpr (std::is_same_v<X, choice_expression>) {
				return match_choice(x, e, c);
			} else if constexpr (std::is_same_v<X, zero_or_more_expression>) {
				return match_repetition(x.inner, e, c, 0);
			} else if constexpr (std::is_same_v<X, one_or_more_expression>) {
				return match_repetition(x.inner, e, c, 1);
			} else if constexpr (std::is_same_v<X, optional_expression>) {
				return match_optional(x, e, c);
			} else if constexpr (std::is_same_v<X, and_predicate_expression>) {
				return match_predicate(x.inner, e, c, true);
			} else if constexpr (std::is_same_v<X, not_predicate_expression>) {
				return match_predicate(x.inner, e, c, false);
			} else {
				static_assert(detail::always_false_v<X>, "non-exhaustive visitor!");
			}
		}, body);
	}

	[[nodiscard]] outcome match_terminal(terminal_expression const& t, expression const& e, cursor const& c)
	{
		if (c.starts_with(t.literal))
			return make_node(e, c.index(), c.index() + t.literal.size());
		note_failure(c.index(), e);
		return match_failure{c.index()};
	}

	[[nodiscard]] outcome match_nonterminal(nonterminal_expression const& nt, expression const& e, cursor const& c)
	{
		auto const rules = nt.rules.lock();
		if (rules == nullptr)
			throw bad_grammar{};
		expression const body = rules->slots.at(nt.slot).body;
		if (!body.valid())
			throw undefined_rule_error{nt.name};
		call_key const key{e.identity(), c.index(), false};
		if (!active_.insert(key).second)
			throw left_recursion_error{nt.name, c.index()};
		detail::scope_exit const deactivate{[this, &key]() noexcept { active_.erase(key); }};
		if (call_depth_ >= options_.max_call_depth)
			throw recursion_limit_error{};
		++call_depth_;
		detail::scope_exit const unwind{[this]() noexcept { --call_depth_; }};
		trace(trace_kind::enter, nt.name, c.index(), c.index());
		auto result = match(body, c);
		if (auto const* n = std::get_if<node_ptr>(&result); n != nullptr) {
			node_ptr const& inner = *n;
			trace(trace_kind::match, nt.name, c.index(), inner->end_offset());
			return std::make_shared<syntax_node const>(subject_, inner->start_offset(), inner->end_offset(), inner->elements(), e, inner);
		}
		trace(trace_kind::fail, nt.name, c.index(), std::get<match_failure>(result).furthest);
		return result;
	}

	[[nodiscard]] outcome match_sequence(sequence_expression const& s, expression const& e, cursor const& c)
	{
		node_list elements;
		elements.reserve(s.elements.size());
		cursor position{c};
		for (auto const& child : s.elements) {
			auto result = match(child, position);
			if (auto const* f = std::get_if<match_failure>(&result); f != nullptr)
				return *f;
			auto& n = std::get<node_ptr>(result);
			position = position.advance(n->size());
			elements.push_back(std::move(n));
		}
		return make_node(e, c.index(), position.index(), std::move(elements));
	}

	[[nodiscard]] outcome match_choice(choice_expression const& ch, expression const& e, cursor const& c)
	{
		std::size_t furthest{c.index()};
		for (auto const& alternative : ch.alternatives) {
			auto result = match(alternative, c);
			if (auto const* n = std::get_if<node_ptr>(&result); n != nullptr) {
				if (e.extended())
					return std::make_shared<syntax_node const>(**n, e);
				return result;
			}
			furthest = (std::max)(furthest, std::get<match_failure>(result).furthest);
		}
		if (ch.alternatives.empty())
			note_failure(c.index(), e);
		return match_failure{furthest};
	}

	// A step that consumes nothing is kept and ends the loop.
	[[nodiscard]] outcome match_repetition(expression const& inner, expression const& e, cursor const& c, std::size_t minimum)
	{
		node_list elements;
		cursor position{c};
		for (;;) {
			auto result = match(inner, position);
			if (auto const* f = std::get_if<match_failure>(&result); f != nullptr) {
				if (elements.size() < minimum)
					return *f;
				break;
			}
			auto& n = std::get<node_ptr>(result);
			bool const progressed = !n->empty();
			position = position.advance(n->size());
			elements.push_back(std::move(n));
			if (!progressed)
				break;
		}
		return make_node(e, c.index(), position.index(), std::move(elements));
	}

	[[nodiscard]] outcome match_optional(optional_expression const& o, expression const& e, cursor const& c)
	{
		auto result = match(o.inner, c);
		if (auto* n = std::get_if<node_ptr>(&result); n != nullptr) {
			auto const end = (*n)->end_offset();
			return make_node(e, c.index(), end, node_list{std::move(*n)});
		}
		return make_node(e, c.index(), c.index());
	}

	[[nodiscard]] outcome match_predicate(expression const& inner, expression const& e, cursor const& c, bool positive)
	{
		bool matched{false};
		{
			++predicate_depth_;
			detail::scope_exit const restore{[this]() noexcept { --predicate_depth_; }};
			matched = std::holds_alternative<node_ptr>(match(inner, c));
		}
		if (matched == positive)
			return make_node(e, c.index(), c.index());
		note_failure(c.index(), e);
		return match_failure{c.index()};
	}

public:
	match_context(std::string_view subject, parser_options const& options) : subject_{subject}, options_{options} {}
	[[nodiscard]] std::size_t furthest() const noexcept { return furthest_; }
	[[nodiscard]] std::vector<expression> take_expected() noexcept { return std::move(expected_); }

	[[nodiscard]] outcome match(expression const& e, cursor const& c)
	{
		auto const& body = e.body();
		if (auto const* t = std::get_if<terminal_expression>(&body); t != nullptr)
			return match_terminal(*t, e, c);
		if (!options_.memoize)
			return evaluate(e, body, c);
		call_key const key{e.identity(), c.index(), predicate_depth_ > 0};
		if (auto const m = memo_.find(key); m != memo_.end())
			return m->second;
		auto result = evaluate(e, body, c);
		memo_.insert_or_assign(key, result);
		return result;
	}
};

} // namespace detail

class parse_result
{
	std::string_view subject_;
	node_ptr root_;
	std::size_t furthest_failure_{0};
	std::vector<expression> expected_;
	std::uint_least32_t tab_width_{parser_options::default_tab_width};
	std::uint_least32_t tab_alignment_{parser_options::default_tab_alignment};

public:
	parse_result(std::string_view subject, node_ptr root, std::size_t furthest, std::vector<expression> expected, parser_options const& options)
		: subject_{subject}, root_{std::move(root)}, furthest_failure_{furthest}, expected_{std::move(expected)}
		, tab_width_{options.tab_width}, tab_alignment_{options.tab_alignment}
	{}

	[[nodiscard]] bool success() const noexcept { return root_ != nullptr; }
	[[nodiscard]] bool failure() const noexcept { return root_ == nullptr; }
	[[nodiscard]] explicit operator bool() const noexcept { return success(); }
	[[nodiscard]] std::string_view subject() const noexcept { return subject_; }
	[[nodiscard]] node_ptr const& root_ptr() const noexcept { return root_; }
	[[nodiscard]] syntax_node const* operator->() const { return &root(); }
	[[nodiscard]] std::size_t furthest_failure_index() const noexcept { return furthest_failure_; }
	[[nodiscard]] std::vector<expression> const& expected() const noexcept { return expected_; }
	[[nodiscard]] syntax_position furthest_failure_position() const { return position_at(furthest_failure_); }

	[[nodiscard]] syntax_node const& root() const
	{
		if (root_ == nullptr)
			throw bad_result_access{};
		return *root_;
	}

	template <class T>
	[[nodiscard]] T get(std::string_view name) const
	{
		return root().get<T>(name);
	}

	[[nodiscard]] syntax_position position_at(std::size_t index) const
	{
		syntax_position position{1, 1};
		auto const last = (std::min)(index, subject_.size());
		for (std::size_t i = 0; i < last; ++i) {
			auto const ch = static_cast<unsigned char>(subject_[i]);
			if (ch == '\n') {
				if (i == 0 || subject_[i - 1] != '\r')
					++position.line;
				position.column = 1;
			} else if (ch == '\r') {
				++position.line;
				position.column = 1;
			} else if (ch == '\t') {
				auto const oldcolumn = position.column;
				auto const newcolumn = oldcolumn + tab_width_;
				auto const alignedcolumn = (tab_alignment_ > 0) ? newcolumn - ((newcolumn - 1) % tab_alignment_) : newcolumn;
				position.column = (std::max)((std::min)(newcolumn, alignedcolumn), oldcolumn);
			} else if ((ch & 0xC0U) != 0x80U) {
				++position.column;
			}
		}
		return position;
	}
};

class parser
{
	friend class grammar;

	std::shared_ptr<detail::rule_table const> rules_;
	expression start_;
	parser_options options_;

	parser(std::shared_ptr<detail::rule_table const> rules, expression start, parser_options options)
		: rules_{std::move(rules)}, start_{std::move(start)}, options_{std::move(options)}
	{}

public:
	[[nodiscard]] expression const& start_rule() const noexcept { return start_; }
	[[nodiscard]] std::string_view start_rule_name() const noexcept { return start_.rule_name(); }
	[[nodiscard]] parser_options const& options() const noexcept { return options_; }
	[[nodiscard]] parse_result parse(char const* input) const { return parse((input != nullptr) ? std::string_view{input} : throw bad_input{}); }
	parse_result parse(std::string&& input) const = delete;

	[[nodiscard]] parse_result parse(std::string_view input) const
	{
		detail::match_context context{input, options_};
		auto result = context.match(start_, cursor{input, 0});
		std::size_t furthest = context.furthest();
		if (auto* n = std::get_if<node_ptr>(&result); n != nullptr) {
			auto const end = (*n)->end_offset();
			if (end == input.size())
				return parse_result{input, std::move(*n), furthest, context.take_expected(), options_};
			if (end > furthest)
				return parse_result{input, nullptr, end, {}, options_};
		} else {
			auto const failed_at = std::get<match_failure>(result).furthest;
			if (failed_at > furthest)
				return parse_result{input, nullptr, failed_at, {}, options_};
		}
		return parse_result{input, nullptr, furthest, context.take_expected(), options_};
	}
};

class parsing_rule
{
	expression nonterminal_;
	expression body_;

public:
	parsing_rule(expression head, expression body)
		: nonterminal_{std::move(head)}, body_{std::move(body)}
	{
		if (!nonterminal_.is_nonterminal())
			throw bad_expression{"parsing rule must be headed by a nonterminal"};
		if (!body_.valid())
			throw bad_expression{};
	}

	[[nodiscard]] expression const& nonterminal() const noexcept { return nonterminal_; }
	[[nodiscard]] expression const& body() const noexcept { return body_; }
	[[nodiscard]] std::string_view name() const noexcept { return nonterminal_.rule_name(); }
};

class grammar
{
	std::shared_ptr<detail::rule_table> rules_;

	[[nodiscard]] detail::rule_table& table() const
	{
		if (rules_ == nullptr)
			throw bad_grammar{};
		return *rules_;
	}

	[[nodiscard]] detail::rule_table& mutable_table() const
	{
		auto& t = table();
		if (t.frozen)
			throw frozen_grammar_error{};
		return t;
	}

	[[nodiscard]] std::size_t slot_of(expression const& nt) const
	{
		auto const* x = nt.valid() ? std::get_if<nonterminal_expression>(&nt.body()) : nullptr;
		if (x == nullptr || x->rules.lock() != rules_)
			throw bad_expression{"expression is not a nonterminal of this grammar"};
		return x->slot;
	}

	expression define_slot(std::size_t slot, expression body)
	{
		auto& t = mutable_table();
		if (!body.valid())
			throw bad_expression{};
		auto& s = t.slots[slot];
		if (s.body.valid())
			throw duplicate_rule_error{s.name};
		s.body = std::move(body);
		t.declaration_order.push_back(slot);
		return s.placeholder;
	}

	// Walks every rule reachable from the start rule and requires a body for
	// each. Nonterminals are visited once, so cyclic grammars terminate.
	void validate(std::size_t start) const
	{
		auto const& t = table();
		std::vector<expression> pending{t.slots[start].placeholder};
		std::unordered_set<detail::expression_data const*> visited;
		while (!pending.empty()) {
			auto const e = detail::pop_back(pending);
			if (!visited.insert(e.identity()).second)
				continue;
			std::visit([&pending](auto const& x) {
				using X = std::decay_t<decltype(x)>;
				if constexpr (std::is_same_v<X, terminal_expression>) {
					// leaf
				} else if constexpr (std::is_same_v<X, nonterminal_expression>) {
					auto const rules = x.rules.lock();
					if (rules == nullptr)
						throw bad_grammar{};
					auto const& slot = rules->slots.at(x.slot);
					if (!slot.body.valid())
						throw undefined_rule_error{slot.name};
					pending.push_back(slot.body);
				} else if constexpr (std::is_same_v<X, sequence_expression>) {
					pending.insert(pending.end(), x.elements.begin(), x.elements.end());
				} else if constexpr (std::is_same_v<X, choice_expression>) {
					pending.insert(pending.end(), x.alternatives.begin(), x.alternatives.end());
				} else if constexpr (std::is_same_v<X, zero_or_more_expression> || std::is_same_v<X, one_or_more_expression>
						|| std::is_same_v<X, optional_expression> || std::is_same_v<X, and_predicate_expression>
						|| std::is_same_v<X, not_predicate_expression>) {
					pending.push_back(x.inner);
				} else {
					static_assert(detail::always_false_v<X>, "non-exhaustive visitor!");
				}
			}, e.body());
		}
	}

	[[nodiscard]] parser make_parser(std::size_t start, parser_options options)
	{
		auto& t = table();
		t.frozen = true;
		validate(start);
		return parser{rules_, t.slots[start].placeholder, std::move(options)};
	}

public:
	grammar() : rules_{std::make_shared<detail::rule_table>()} {}
	template <class B, class = std::enable_if_t<is_grammar_builder_v<B>>> explicit grammar(B&& build) : grammar{} { std::forward<B>(build)(*this); }
	grammar(grammar const&) = delete;
	grammar(grammar&&) noexcept = default;
	grammar& operator=(grammar const&) = delete;
	grammar& operator=(grammar&&) noexcept = default;
	~grammar() = default;

	[[nodiscard]] bool frozen() const noexcept { return rules_ != nullptr && rules_->frozen; }
	[[nodiscard]] static expression exp(std::string_view literal) { return language::terminal(literal); }

	expression nonterminal(std::string_view name)
	{
		auto& t = table();
		if (auto const existing = t.find(name); existing)
			return t.slots[*existing].placeholder;
		if (t.frozen)
			throw frozen_grammar_error{};
		if (name.empty())
			throw bad_expression{"rule name cannot be empty"};
		auto const slot = t.slots.size();
		auto placeholder = detail::make_expression(nonterminal_expression{std::string{name}, rules_, slot});
		t.slots.push_back(detail::rule_slot{std::string{name}, placeholder, expression{}});
		t.names.emplace(std::string{name}, slot);
		return placeholder;
	}

	expression declare_rule(std::string_view name, expression body)
	{
		(void)mutable_table();
		return define_slot(slot_of(nonterminal(name)), std::move(body));
	}

	expression declare_rule(char const* name, expression body) { return declare_rule(std::string_view{name}, std::move(body)); }
	expression declare_rule(expression const& nt, expression body) { return define_slot(slot_of(nt), std::move(body)); }
	expression add_rule(parsing_rule const& r) { return declare_rule(r.nonterminal(), r.body()); }
	expression add_rule(expression const& nt, expression body) { return declare_rule(nt, std::move(body)); }
	expression rule(std::string_view name, expression body) { return declare_rule(name, std::move(body)); }

	[[nodiscard]] bool has_rule(std::string_view name) const
	{
		auto const& t = table();
		auto const slot = t.find(name);
		return slot && t.slots[*slot].body.valid();
	}

	[[nodiscard]] expression const& resolve(std::string_view name) const
	{
		auto const& t = table();
		auto const slot = t.find(name);
		if (!slot || !t.slots[*slot].body.valid())
			throw undefined_rule_error{name};
		return t.slots[*slot].body;
	}

	[[nodiscard]] std::vector<std::string_view> rule_names() const
	{
		auto const& t = table();
		std::vector<std::string_view> names;
		names.reserve(t.declaration_order.size());
		for (auto const slot : t.declaration_order)
			names.emplace_back(t.slots[slot].name);
		return names;
	}

	[[nodiscard]] parser new_parser(parser_options options = {})
	{
		auto const& t = table();
		if (t.declaration_order.empty())
			throw bad_grammar{};
		return make_parser(t.declaration_order.front(), std::move(options));
	}

	[[nodiscard]] parser new_parser(std::string_view start, parser_options options = {})
	{
		auto const slot = table().find(start);
		if (!slot)
			throw undefined_rule_error{start};
		return make_parser(*slot, std::move(options));
	}

	[[nodiscard]] parser new_parser(char const* start, parser_options options = {}) { return new_parser(std::string_view{start}, std::move(options)); }
};

namespace language {

using sprout::accessor; using sprout::node_ptr; using sprout::node_list; using sprout::trace_kind;
using cursor = sprout::cursor; using expression = sprout::expression; using grammar = sprout::grammar;
using parser = sprout::parser; using parser_options = sprout::parser_options; using parse_result = sprout::parse_result;
using parsing_rule = sprout::parsing_rule; using syntax_node = sprout::syntax_node; using syntax_position = sprout::syntax_position;
using trace_event = sprout::trace_event; using trait = sprout::trait;

inline namespace operators {

[[nodiscard]] inline expression operator ""_t(char const* s, std::size_t n) { return terminal(std::string_view{s, n}); }

// Chains of an operator extend the anonymous temporary built by the previous
// application, so a > b > c is one three-element sequence.
[[nodiscard]] inline expression operator>(expression const& e1, expression const& e2) { return sequence({e1, e2}); }
[[nodiscard]] inline expression operator|(expression const& e1, expression const& e2) { return choice({e1, e2}); }

[[nodiscard]] inline expression operator>(expression&& e1, expression const& e2)
{
	if (auto const* s = std::get_if<sequence_expression>(&e1.body()); s != nullptr && !e1.extended()) {
		auto elements = s->elements;
		elements.push_back(e2);
		return sequence(std::move(elements));
	}
	return sequence({std::move(e1), e2});
}

[[nodiscard]] inline expression operator|(expression&& e1, expression const& e2)
{
	if (auto const* ch = std::get_if<choice_expression>(&e1.body()); ch != nullptr && !e1.extended()) {
		auto alternatives = ch->alternatives;
		alternatives.push_back(e2);
		return choice(std::move(alternatives));
	}
	return choice({std::move(e1), e2});
}

[[nodiscard]] inline expression operator*(expression const& e) { return zero_or_more(e); }
[[nodiscard]] inline expression operator+(expression const& e) { return one_or_more(e); }
[[nodiscard]] inline expression operator~(expression const& e) { return optional(e); }
[[nodiscard]] inline expression operator&(expression const& e) { return and_predicate(e); } // NOLINT(google-runtime-operator)
[[nodiscard]] inline expression operator!(expression const& e) { return not_predicate(e); }

} // namespace operators

} // namespace language

} // namespace sprout

#endif
