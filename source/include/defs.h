// defs.h
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once
#include "zpr.h"
#include "zbuf.h"

#include <set>
#include <string>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <functional>

#include "result.h"

namespace ast { struct Expr; }

namespace redex
{
	constexpr int FLAG_TRACE            = 0x1;
	constexpr int FLAG_NO_DIAGNOSTICS   = 0x2;

	// which redexes are eligible. both pick leftmost-outermost first; only Eager
	// looks inside abstraction bodies and application arguments.
	enum class Strategy
	{
		Eager,
		LazyNoBinder,
	};

	// selects the grammar (whether numbers and arithmetic exist) together with
	// the matching output convention.
	enum class Dialect
	{
		Plain,
		Arithmetic,
	};

	enum class ErrorKind
	{
		Usage,
		Parse,
		StepLimit,
		Io,
	};

	struct Failure
	{
		ErrorKind kind;
		std::string msg;
	};

	enum class StepKind
	{
		Beta,
		Fold,
	};

	// called after every step with the step number (starting at 1) and the new term.
	using Observer = std::function<void (StepKind, size_t, const ast::Expr*)>;

	struct EvalOptions
	{
		Strategy strategy = Strategy::LazyNoBinder;

		// 0 means no limit.
		size_t max_steps = 0;

		Observer observer;
	};

	struct Context
	{
		int flags = 0;
		Strategy strategy = Strategy::LazyNoBinder;
		Dialect dialect = Dialect::Arithmetic;
		size_t max_steps = 0;
	};

	// util.cpp
	std::set<std::string> free_variables(const ast::Expr* expr);
	std::string fresh_name(const std::set<std::string>& used);
	ast::Expr* substitute(const ast::Expr* expr, const std::string& var, const ast::Expr* value);

	// eval.cpp
	std::pair<ast::Expr*, bool> step(const ast::Expr* expr, Strategy strat);
	std::pair<ast::Expr*, bool> fold_arithmetic(const ast::Expr* expr, Strategy strat);

	ast::Expr* evaluate(const ast::Expr* expr, Strategy strat);
	zst::Result<ast::Expr*, Failure> evaluate(const ast::Expr* expr, const EvalOptions& opts);

	// print.cpp
	std::string print(const ast::Expr* expr, Dialect dialect);
	std::string print_result(const ast::Expr* expr, Dialect dialect);
	std::string format_number(double value);

	// repl.cpp
	zst::Result<std::string, Failure> run(const Context& ctx, zbuf::str_view input);
	int exit_code(ErrorKind kind);

	void printError(zbuf::str_view msg);

	void repl(Context& ctx);
	void evalLine(Context& ctx, zbuf::str_view sv);

	// file.cpp
	zst::Result<size_t, Failure> loadFile(Context& ctx, zbuf::str_view path);

	constexpr const char* COLOUR_RESET  = "\x1b[0m";
	constexpr const char* YELLOW        = "\x1b[33m";
	constexpr const char* GREEN         = "\x1b[32m";

	constexpr const char* GREEN_BOLD    = "\x1b[1m\x1b[32m";
	constexpr const char* YELLOW_BOLD   = "\x1b[1m\x1b[33m";
	constexpr const char* BLUE_BOLD     = "\x1b[1m\x1b[34m";
	constexpr const char* RED_BOLD      = "\x1b[1m\x1b[31m";
	constexpr const char* BLACK_BOLD    = "\x1b[1m";
	constexpr const char* GREY_BOLD     = "\x1b[30;1m";
}

namespace unicode
{
	constexpr int32_t LAMBDA = 0x03BB;

	int32_t get_codepoint(zbuf::str_view str, size_t* length);
	size_t is_category(zbuf::str_view str, const std::initializer_list<int>& categories);
	size_t get_codepoint_length(zbuf::str_view str);
	size_t is_space(zbuf::str_view str);
}
