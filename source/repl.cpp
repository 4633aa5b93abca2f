// repl.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include "ast.h"
#include "defs.h"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace redex
{
	using zst::Ok;
	using zst::Err;

	zbuf::str_view trim(zbuf::str_view s);
	bool runReplCommand(Context& ctx, zbuf::str_view cmd);
	void parseError(const parser::Error& e, zbuf::str_view input);

	static const char* strategy_name(Strategy s)
	{
		return s == Strategy::Eager ? "normal order" : "lazy (call-by-name)";
	}

	static const char* dialect_name(Dialect d)
	{
		return d == Dialect::Arithmetic ? "arithmetic" : "plain";
	}

	zst::Result<std::string, Failure> run(const Context& ctx, zbuf::str_view input)
	{
		auto expr_or_error = parser::parse(input, ctx.dialect);
		if(!expr_or_error)
		{
			if(!(ctx.flags & FLAG_NO_DIAGNOSTICS))
				parseError(expr_or_error.error(), input);

			return Err(Failure { ErrorKind::Parse, expr_or_error.error().msg });
		}

		auto expr = expr_or_error.unwrap();

		EvalOptions opts { };
		opts.strategy = ctx.strategy;
		opts.max_steps = ctx.max_steps;

		if(ctx.flags & FLAG_TRACE)
		{
			zpr::println("{}0.{} {}", BLACK_BOLD, COLOUR_RESET, print(expr, ctx.dialect));

			opts.observer = [&ctx](StepKind kind, size_t n, const ast::Expr* e) {
				if(kind == StepKind::Beta)
					zpr::println("{}{}.{} {}β-red:{} {}", BLACK_BOLD, n, COLOUR_RESET, YELLOW, COLOUR_RESET, print(e, ctx.dialect));

				else
					zpr::println("{}{}.{} {}fold:{}  {}", BLACK_BOLD, n, COLOUR_RESET, GREEN, COLOUR_RESET, print(e, ctx.dialect));
			};
		}

		auto result = evaluate(expr, opts);
		delete expr;

		if(ctx.flags & FLAG_TRACE)
			zpr::println("{}*.{} {}done.{}", BLACK_BOLD, COLOUR_RESET, BLUE_BOLD, COLOUR_RESET);

		if(!result)
			return Err(result.error());

		auto ret = print_result(*result, ctx.dialect);
		delete *result;

		return Ok(ret);
	}

	int exit_code(ErrorKind kind)
	{
		switch(kind)
		{
			case ErrorKind::Usage:      return 1;
			case ErrorKind::Parse:      return 1;
			case ErrorKind::StepLimit:  return 2;
			case ErrorKind::Io:         return 3;
		}

		abort();
	}

	void evalLine(Context& ctx, zbuf::str_view sv)
	{
		auto input = trim(sv);
		if(input.empty())
			return;

		// comment
		if(input.front() == '#')
			return;

		if(input.front() == ':')
		{
			if(runReplCommand(ctx, input))
				zpr::println("");

			return;
		}

		// parse errors were already reported by run().
		auto result = run(ctx, input);
		if(result)
			zpr::println("{}\n", *result);

		else if(result.error().kind != ErrorKind::Parse)
			printError(result.error().msg);
	}

	void repl(Context& ctx)
	{
		while(true)
		{
			zpr::print("λ> ");

			// read one line
			std::string input; std::getline(std::cin, input);
			if(std::cin.eof())
				break;

			if(trim(input) == ":q")
				break;

			evalLine(ctx, input);
		}

		zpr::println("");
	}

	// returns false if the command was not understood.
	bool runReplCommand(Context& ctx, zbuf::str_view input)
	{
		auto print_thingy = [](const char* thing, const char* value) {
			zpr::println("{}*.{} {}: {}{}{}", BLACK_BOLD, COLOUR_RESET, thing, GREEN_BOLD, value, COLOUR_RESET);
		};

		if(input == ":s")
		{
			ctx.strategy = (ctx.strategy == Strategy::Eager ? Strategy::LazyNoBinder : Strategy::Eager);
			print_thingy("strategy", strategy_name(ctx.strategy));
		}
		else if(input == ":p")
		{
			ctx.dialect = (ctx.dialect == Dialect::Arithmetic ? Dialect::Plain : Dialect::Arithmetic);
			print_thingy("grammar", dialect_name(ctx.dialect));
		}
		else if(input == ":t")
		{
			ctx.flags ^= FLAG_TRACE;
			print_thingy("tracing", (ctx.flags & FLAG_TRACE) ? "enabled" : "disabled");
		}
		else if(input.find(":n ") == 0)
		{
			auto arg = trim(input.drop(strlen(":n "))).str();

			char* end = nullptr;
			auto n = std::strtoull(arg.c_str(), &end, 10);
			if(arg.empty() || *end != '\0')
			{
				printError(zpr::sprint("expected a number for ':n', found '{}'", arg));
				return false;
			}

			ctx.max_steps = n;
			auto limit = (n == 0 ? std::string("none") : zpr::sprint("{}", n));
			print_thingy("step limit", limit.c_str());
		}
		else if(input.find(":load ") == 0)
		{
			auto path = trim(input.drop(strlen(":load ")));
			if(path.empty())
			{
				printError("expected path for ':load'");
				return false;
			}

			auto loaded = loadFile(ctx, path);
			if(!loaded)
			{
				printError(loaded.error().msg);
				return false;
			}
		}
		else
		{
			printError(zpr::sprint("unknown command '{}'", input));
			return false;
		}

		return true;
	}

	void printError(zbuf::str_view msg)
	{
		zpr::fprintln(stderr, "{}error:{} {}{}{}", RED_BOLD, COLOUR_RESET, BLACK_BOLD, msg, COLOUR_RESET);
	}

	void parseError(const parser::Error& e, zbuf::str_view input)
	{
		printError(e.msg);
		zpr::fprintln(stderr, "{}here:{}  {}", GREY_BOLD, COLOUR_RESET, input);

		std::string underline;
		if(e.loc.length > 1)
			for(size_t i = 0; i < e.loc.length; i++) underline += "\u203e";
		else
			underline = "^";

		zpr::fprintln(stderr, "{}{}{}{}\n", zpr::w(7 + e.loc.begin)(""), RED_BOLD, underline, COLOUR_RESET);
	}

	zbuf::str_view trim(zbuf::str_view s)
	{
		while(!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r'))
			s.remove_prefix(1);

		while(!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
			s.remove_suffix(1);

		return s;
	}
}
