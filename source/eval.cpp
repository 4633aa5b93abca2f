// eval.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include <cstdlib>

#include "ast.h"

namespace redex
{
	using namespace ast;
	using zst::Ok;
	using zst::Err;

	// performs the leftmost-outermost reduction allowed by `strat`, returning the new
	// term, or nullptr if there was none. arithmetic is not folded here.
	static Expr* beta_reduction(const Expr* expr, Strategy strat)
	{
		switch(expr->kind)
		{
			case Kind::Apply: {
				auto app = static_cast<const Apply*>(expr);

				// the argument goes in as-is, without being evaluated first.
				if(auto func = as<Lambda>(app->fn); func != nullptr)
					return substitute(func->body, func->arg, app->arg);

				if(auto fn = beta_reduction(app->fn, strat); fn != nullptr)
					return new Apply(app->loc, fn, app->arg->clone());

				if(strat == Strategy::Eager)
				{
					if(auto arg = beta_reduction(app->arg, strat); arg != nullptr)
						return new Apply(app->loc, app->fn->clone(), arg);
				}

				return nullptr;
			}

			case Kind::Lambda: {
				if(strat != Strategy::Eager)
					return nullptr;

				auto l = static_cast<const Lambda*>(expr);
				if(auto body = beta_reduction(l->body, strat); body != nullptr)
					return new Lambda(l->loc, l->argloc, l->arg, body);

				return nullptr;
			}

			case Kind::BinOp: {
				auto b = static_cast<const BinOp*>(expr);
				if(auto lhs = beta_reduction(b->lhs, strat); lhs != nullptr)
					return new BinOp(b->loc, b->op, lhs, b->rhs->clone());

				if(auto rhs = beta_reduction(b->rhs, strat); rhs != nullptr)
					return new BinOp(b->loc, b->op, b->lhs->clone(), rhs);

				return nullptr;
			}

			case Kind::Negate: {
				auto n = static_cast<const Negate*>(expr);
				if(auto operand = beta_reduction(n->operand, strat); operand != nullptr)
					return new Negate(n->loc, operand);

				return nullptr;
			}

			case Kind::Var:
			case Kind::Number:
				return nullptr;
		}

		abort();
	}

	static double arithmetic(Op op, double a, double b)
	{
		switch(op)
		{
			case Op::Plus:  return a + b;
			case Op::Minus: return a - b;
			case Op::Times: return a * b;
			case Op::Div:   return a / b;
		}

		abort();
	}

	// collapses every arithmetic node whose operands are (or fold to) numbers. under
	// LazyNoBinder, applications and lambdas are opaque.
	static Expr* fold(const Expr* expr, Strategy strat, bool& changed)
	{
		switch(expr->kind)
		{
			case Kind::BinOp: {
				auto b = static_cast<const BinOp*>(expr);
				auto lhs = fold(b->lhs, strat, changed);
				auto rhs = fold(b->rhs, strat, changed);

				auto x = as<Number>(lhs);
				auto y = as<Number>(rhs);
				if(x && y)
				{
					auto ret = new Number(b->loc, arithmetic(b->op, x->value, y->value));
					delete lhs;
					delete rhs;

					changed = true;
					return ret;
				}

				return new BinOp(b->loc, b->op, lhs, rhs);
			}

			case Kind::Negate: {
				auto n = static_cast<const Negate*>(expr);
				auto operand = fold(n->operand, strat, changed);

				if(auto x = as<Number>(operand); x != nullptr)
				{
					auto ret = new Number(n->loc, -x->value);
					delete operand;

					changed = true;
					return ret;
				}

				return new Negate(n->loc, operand);
			}

			case Kind::Apply: {
				if(strat != Strategy::Eager)
					return expr->clone();

				auto a = static_cast<const Apply*>(expr);
				auto fn = fold(a->fn, strat, changed);
				return new Apply(a->loc, fn, fold(a->arg, strat, changed));
			}

			case Kind::Lambda: {
				if(strat != Strategy::Eager)
					return expr->clone();

				auto l = static_cast<const Lambda*>(expr);
				return new Lambda(l->loc, l->argloc, l->arg, fold(l->body, strat, changed));
			}

			case Kind::Var:
			case Kind::Number:
				return expr->clone();
		}

		abort();
	}

	std::pair<Expr*, bool> step(const Expr* expr, Strategy strat)
	{
		if(auto next = beta_reduction(expr, strat); next != nullptr)
			return { next, true };

		return { expr->clone(), false };
	}

	std::pair<Expr*, bool> fold_arithmetic(const Expr* expr, Strategy strat)
	{
		bool changed = false;
		auto ret = fold(expr, strat, changed);

		return { ret, changed };
	}

	zst::Result<Expr*, Failure> evaluate(const Expr* expr, const EvalOptions& opts)
	{
		Expr* current = expr->clone();
		size_t steps = 0;

		while(true)
		{
			// beta-reduce as long as possible; once stuck, do one full folding pass
			// and go back to beta-reducing if it changed anything.
			auto kind = StepKind::Beta;
			Expr* next = beta_reduction(current, opts.strategy);

			if(next == nullptr)
			{
				bool changed = false;
				next = fold(current, opts.strategy, changed);

				if(!changed)
				{
					delete next;
					return Ok(current);
				}

				kind = StepKind::Fold;
			}

			if(opts.max_steps > 0 && steps == opts.max_steps)
			{
				delete next;
				delete current;

				auto fmt = zpr::tt::str_view("no normal form reached within {} step{}");
				return Err(Failure {
					ErrorKind::StepLimit,
					zpr::sprint(fmt, steps, steps == 1 ? "" : "s")
				});
			}

			delete current;
			current = next;
			steps += 1;

			if(opts.observer)
				opts.observer(kind, steps, current);
		}
	}

	Expr* evaluate(const Expr* expr, Strategy strat)
	{
		auto opts = EvalOptions { };
		opts.strategy = strat;

		// without a step limit this cannot fail (but it might not return either).
		return evaluate(expr, opts).unwrap();
	}
}




namespace ast
{
	// expressions own their subs.
	Expr::~Expr()       { }
	Var::~Var()         { }
	Number::~Number()   { }
	Apply::~Apply()     { delete this->fn; delete this->arg; }
	Lambda::~Lambda()   { delete this->body; }
	BinOp::~BinOp()     { delete this->lhs; delete this->rhs; }
	Negate::~Negate()   { delete this->operand; }

	Var* Var::clone() const
	{
		return new Var(this->loc, this->name);
	}

	Apply* Apply::clone() const
	{
		return new Apply(this->loc, this->fn->clone(), this->arg->clone());
	}

	Lambda* Lambda::clone() const
	{
		return new Lambda(this->loc, this->argloc, this->arg, this->body->clone());
	}

	Number* Number::clone() const
	{
		return new Number(this->loc, this->value);
	}

	BinOp* BinOp::clone() const
	{
		return new BinOp(this->loc, this->op, this->lhs->clone(), this->rhs->clone());
	}

	Negate* Negate::clone() const
	{
		return new Negate(this->loc, this->operand->clone());
	}

	Var* var(std::string name)                          { return new Var({ }, std::move(name)); }
	Apply* apply(const Expr* fn, const Expr* arg)       { return new Apply({ }, fn, arg); }
	Lambda* lambda(std::string arg, const Expr* body)   { return new Lambda({ }, { }, std::move(arg), body); }
	Number* number(double value)                        { return new Number({ }, value); }
	BinOp* binop(Op op, const Expr* lhs, const Expr* rhs) { return new BinOp({ }, op, lhs, rhs); }
	Negate* negate(const Expr* operand)                 { return new Negate({ }, operand); }
}
