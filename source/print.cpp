// print.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include <cmath>
#include <string>
#include <cstdlib>
#include <charconv>

#include "ast.h"

namespace redex
{
	using namespace ast;

	static bool is_op(const Expr* expr, Op op)
	{
		auto b = as<BinOp>(expr);
		return b != nullptr && b->op == op;
	}

	// whether an operand of `parent` needs brackets. this deliberately brackets more
	// than precedence requires (eg. the left side of a subtraction), and a product
	// is the only thing that may sit unbracketed under a multiplication.
	static bool needs_parens(Op parent, const Expr* side)
	{
		switch(side->kind)
		{
			case Kind::Var:
			case Kind::Number:
				return false;

			case Kind::BinOp:
				return !(parent == Op::Times && is_op(side, Op::Times));

			case Kind::Negate:
			case Kind::Apply:
			case Kind::Lambda:
				return true;
		}

		abort();
	}

	static void int_print(const Expr* expr, Dialect dialect, std::string& out)
	{
		auto add_wrapped = [&out, dialect](const Expr* e, bool wrap) {
			if(wrap) out += "(";
			int_print(e, dialect, out);
			if(wrap) out += ")";
		};

		switch(expr->kind)
		{
			case Kind::Var:
				out += static_cast<const Var*>(expr)->name;
				return;

			case Kind::Number:
				out += format_number(static_cast<const Number*>(expr)->value);
				return;

			case Kind::Lambda: {
				auto l = static_cast<const Lambda*>(expr);
				out += "\\";
				out += l->arg;
				out += ".";

				add_wrapped(l->body, dialect == Dialect::Arithmetic && l->body->kind == Kind::Apply);
				return;
			}

			case Kind::Apply: {
				auto a = static_cast<const Apply*>(expr);
				add_wrapped(a->fn, a->fn->kind == Kind::Lambda);
				out += " ";
				add_wrapped(a->arg, a->arg->kind != Kind::Var && a->arg->kind != Kind::Number);
				return;
			}

			case Kind::BinOp: {
				auto b = static_cast<const BinOp*>(expr);
				add_wrapped(b->lhs, needs_parens(b->op, b->lhs));

				switch(b->op)
				{
					case Op::Plus:  out += " + "; break;
					case Op::Minus: out += " - "; break;
					case Op::Times: out += " * "; break;
					case Op::Div:   out += " / "; break;
				}

				add_wrapped(b->rhs, needs_parens(b->op, b->rhs));
				return;
			}

			case Kind::Negate: {
				auto n = static_cast<const Negate*>(expr);
				out += "-";
				add_wrapped(n->operand, n->operand->kind != Kind::Var && n->operand->kind != Kind::Number);
				return;
			}
		}
	}

	std::string print(const Expr* expr, Dialect dialect)
	{
		std::string ret;
		int_print(expr, dialect, ret);

		return ret;
	}

	std::string print_result(const Expr* expr, Dialect dialect)
	{
		auto ret = print(expr, dialect);
		if(dialect == Dialect::Arithmetic && (expr->kind == Kind::Lambda || expr->kind == Kind::Apply))
			return zpr::sprint("({})", ret);

		return ret;
	}

	std::string format_number(double value)
	{
		if(std::isnan(value))
			return "nan";

		if(std::isinf(value))
			return value < 0 ? "-inf" : "inf";

		// integers print all their digits, never an exponent.
		if(value == std::trunc(value))
		{
			if(value == 0)
				return "0.0";

			char buf[400];
			auto [ end, ec ] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed, 0);
			if(ec != std::errc())
				return zpr::sprint("{}", value);

			return std::string(buf, end) + ".0";
		}

		// otherwise, the shortest digit string that reads back to the same double.
		char buf[64];
		auto [ end, ec ] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
		if(ec != std::errc())
			return zpr::sprint("{}", value);

		auto sci = std::string(buf, end);
		auto e = sci.find('e');

		auto exponent = std::atoi(sci.c_str() + e + 1);
		if(exponent < -4 || exponent > 15)
			return sci;

		std::string digits;
		for(size_t i = 0; i < e; i++)
		{
			if(sci[i] != '.' && sci[i] != '-')
				digits += sci[i];
		}

		std::string ret = (value < 0 ? "-" : "");
		if(exponent < 0)
		{
			ret += "0.";
			ret += std::string(static_cast<size_t>(-exponent - 1), '0');
			ret += digits;
		}
		else
		{
			auto point = static_cast<size_t>(exponent + 1);
			if(digits.size() <= point)
				digits += std::string(point - digits.size() + 1, '0');

			ret += digits.substr(0, point);
			ret += ".";
			ret += digits.substr(point);
		}

		return ret;
	}
}
