// util.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include "ast.h"
#include "defs.h"

#include <set>
#include <string>
#include <cstdlib>

namespace redex
{
	using namespace ast;

	static void collect_free_variables(const Expr* expr, const std::set<std::string>& bound,
		std::set<std::string>& out)
	{
		switch(expr->kind)
		{
			case Kind::Var: {
				auto v = static_cast<const Var*>(expr);
				if(bound.find(v->name) == bound.end())
					out.insert(v->name);

				return;
			}

			case Kind::Apply: {
				auto a = static_cast<const Apply*>(expr);
				collect_free_variables(a->fn, bound, out);
				collect_free_variables(a->arg, bound, out);
				return;
			}

			case Kind::Lambda: {
				auto l = static_cast<const Lambda*>(expr);
				if(bound.find(l->arg) != bound.end())
					return collect_free_variables(l->body, bound, out);

				auto inner = bound;
				inner.insert(l->arg);
				return collect_free_variables(l->body, inner, out);
			}

			case Kind::BinOp: {
				auto b = static_cast<const BinOp*>(expr);
				collect_free_variables(b->lhs, bound, out);
				collect_free_variables(b->rhs, bound, out);
				return;
			}

			case Kind::Negate:
				return collect_free_variables(static_cast<const Negate*>(expr)->operand, bound, out);

			case Kind::Number:
				return;
		}
	}

	std::set<std::string> free_variables(const Expr* expr)
	{
		std::set<std::string> ret;
		collect_free_variables(expr, { }, ret);

		return ret;
	}

	// the first of Var1, Var2, ... that isn't in use. this depends only on `used`, so
	// the same input always renames the same way.
	std::string fresh_name(const std::set<std::string>& used)
	{
		for(size_t i = 1; ; i++)
		{
			auto name = zpr::sprint("Var{}", i);
			if(used.find(name) == used.end())
				return name;
		}
	}

	Expr* substitute(const Expr* expr, const std::string& var, const Expr* value)
	{
		switch(expr->kind)
		{
			case Kind::Var: {
				auto v = static_cast<const Var*>(expr);
				if(v->name == var)  return value->clone();
				else                return v->clone();
			}

			case Kind::Apply: {
				auto a = static_cast<const Apply*>(expr);
				return new Apply(a->loc, substitute(a->fn, var, value), substitute(a->arg, var, value));
			}

			case Kind::Lambda: {
				auto l = static_cast<const Lambda*>(expr);

				// the lambda re-binds the name, so nothing inside refers to ours.
				if(l->arg == var)
					return l->clone();

				auto value_free = free_variables(value);
				if(value_free.find(l->arg) == value_free.end())
					return new Lambda(l->loc, l->argloc, l->arg, substitute(l->body, var, value));

				// the parameter would capture a free variable of the value; rename the
				// parameter first, then substitute into the renamed body.
				auto used = value_free;
				auto body_free = free_variables(l->body);
				used.insert(body_free.begin(), body_free.end());
				used.insert(var);

				auto fresh = fresh_name(used);
				auto fresh_var = Var(l->argloc, fresh);

				auto renamed = substitute(l->body, l->arg, &fresh_var);
				auto body = substitute(renamed, var, value);
				delete renamed;

				return new Lambda(l->loc, l->argloc, fresh, body);
			}

			case Kind::Number:
				return expr->clone();

			case Kind::BinOp: {
				auto b = static_cast<const BinOp*>(expr);
				return new BinOp(b->loc, b->op, substitute(b->lhs, var, value), substitute(b->rhs, var, value));
			}

			case Kind::Negate: {
				auto n = static_cast<const Negate*>(expr);
				return new Negate(n->loc, substitute(n->operand, var, value));
			}
		}

		abort();
	}
}
