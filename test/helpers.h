// helpers.h
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <memory>
#include <string>
#include <cstring>

#include <gtest/gtest.h>

#include "ast.h"
#include "defs.h"

namespace helpers
{
	using Owned = std::unique_ptr<ast::Expr>;

	inline Owned parse(const char* src, redex::Dialect dialect = redex::Dialect::Arithmetic)
	{
		auto result = parser::parse(zbuf::str_view(src, strlen(src)), dialect);
		EXPECT_TRUE(result.ok()) << "failed to parse '" << src << "': " << (result ? "" : result.error().msg);

		return Owned(result ? *result : nullptr);
	}

	inline std::string show(const ast::Expr* expr, redex::Dialect dialect = redex::Dialect::Arithmetic)
	{
		return redex::print(expr, dialect);
	}

	// parse, evaluate without a step limit, and print the way the command line does.
	inline std::string eval(const char* src, redex::Strategy strat,
		redex::Dialect dialect = redex::Dialect::Arithmetic)
	{
		auto expr = parse(src, dialect);
		if(!expr)
			return "<parse error>";

		auto result = Owned(redex::evaluate(expr.get(), strat));
		return redex::print_result(result.get(), dialect);
	}
}
