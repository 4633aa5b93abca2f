// parser.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "ast.h"

#include <cstdlib>

namespace parser
{
	using zst::Ok;
	using zst::Err;

	using TT = TokenType;
	using ResultTy = zst::Result<ast::Expr*, Error>;

	struct State
	{
		State(std::vector<Token> ts) : tokens(std::move(ts)) { }

		bool match(TT t)
		{
			if(this->peek() != t)
				return false;

			this->pop();
			return true;
		}

		const Token& peek(size_t n = 0) const
		{
			return this->pos + n < this->tokens.size() ? this->tokens[this->pos + n] : eof;
		}

		Token pop()
		{
			auto ret = this->peek();
			if(!this->empty())
				this->pos += 1;

			return ret;
		}

		bool empty() const
		{
			return this->pos >= this->tokens.size();
		}

		size_t pos = 0;
		std::vector<Token> tokens;
		Token eof { TT::EndOfFile, Location { 0, 0 }, "" };
	};

	static ResultTy make_error(Location loc, const std::string& msg)
	{
		return Err(Error { msg, loc });
	}

	static Location span(Location from, Location to)
	{
		return Location { from.begin, to.begin + to.length - from.begin };
	}

	static bool starts_atom(const Token& t)
	{
		return t == TT::Identifier || t == TT::Number || t == TT::LParen || t == TT::Lambda;
	}

	static ResultTy parseExpr(State& st);
	static ResultTy parseUnary(State& st);
	static ResultTy parseAtom(State& st);
	static ResultTy parseLambda(State& st);
	static ResultTy parseApply(State& st);
	static ResultTy parseAdditive(State& st);
	static ResultTy parseMultiplicative(State& st);
	static ResultTy parseParenthesised(State& st);

	ResultTy parse(zbuf::str_view str, redex::Dialect dialect)
	{
		if(str.empty())
			return make_error({ }, "empty input");

		auto tokens = lex(str, dialect);
		if(!tokens) return Err(tokens.error());

		auto st = State(std::move(*tokens));

		auto ret = parseExpr(st);
		if(!ret) return ret;

		if(!st.empty())
		{
			delete *ret;
			return make_error(st.peek().loc, zpr::sprint("junk at end of expression: '{}'", st.peek().text));
		}

		return ret;
	}

	static ResultTy parseExpr(State& st)
	{
		return parseAdditive(st);
	}

	// parses `next (op next)*`, associating to the left.
	template <typename Fn>
	static ResultTy parseBinary(State& st, Fn&& next, TT plus_like, ast::Op plus_op, TT minus_like, ast::Op minus_op)
	{
		auto lhs = next(st);
		if(!lhs) return lhs;

		while(st.peek() == plus_like || st.peek() == minus_like)
		{
			auto op = (st.pop() == plus_like ? plus_op : minus_op);

			auto rhs = next(st);
			if(!rhs)
			{
				delete *lhs;
				return rhs;
			}

			auto loc = span((*lhs)->loc, (*rhs)->loc);
			lhs = Ok<ast::Expr*>(new ast::BinOp(loc, op, *lhs, *rhs));
		}

		return lhs;
	}

	static ResultTy parseAdditive(State& st)
	{
		return parseBinary(st, parseMultiplicative, TT::Plus, ast::Op::Plus, TT::Minus, ast::Op::Minus);
	}

	static ResultTy parseMultiplicative(State& st)
	{
		return parseBinary(st, parseUnary, TT::Asterisk, ast::Op::Times, TT::Slash, ast::Op::Div);
	}

	static ResultTy parseUnary(State& st)
	{
		if(st.peek() == TT::Minus)
		{
			auto minus = st.pop();

			auto operand = parseUnary(st);
			if(!operand) return operand;

			return Ok<ast::Expr*>(new ast::Negate(span(minus.loc, (*operand)->loc), *operand));
		}

		return parseApply(st);
	}

	static ResultTy parseApply(State& st)
	{
		auto lhs = parseAtom(st);
		if(!lhs) return lhs;

		while(starts_atom(st.peek()))
		{
			auto rhs = parseAtom(st);
			if(!rhs)
			{
				delete *lhs;
				return rhs;
			}

			auto loc = span((*lhs)->loc, (*rhs)->loc);
			lhs = Ok<ast::Expr*>(new ast::Apply(loc, *lhs, *rhs));
		}

		return lhs;
	}

	static ResultTy parseAtom(State& st)
	{
		if(st.peek() == TT::LParen)
		{
			return parseParenthesised(st);
		}
		else if(st.peek() == TT::Identifier)
		{
			auto tok = st.pop();
			return Ok<ast::Expr*>(new ast::Var(tok.loc, tok.text.str()));
		}
		else if(st.peek() == TT::Number)
		{
			auto tok = st.pop();
			return Ok<ast::Expr*>(new ast::Number(tok.loc, std::strtod(tok.text.str().c_str(), nullptr)));
		}
		else if(st.peek() == TT::Lambda)
		{
			return parseLambda(st);
		}

		return make_error(st.peek().loc, st.empty()
			? zpr::sprint("unexpected end of input")
			: zpr::sprint("unexpected token '{}'", st.peek().text)
		);
	}

	static ResultTy parseParenthesised(State& st)
	{
		auto open = st.pop().loc;

		auto expr = parseExpr(st);
		if(!expr) return expr;

		if(!st.match(TT::RParen))
		{
			delete *expr;
			return make_error(open, zpr::sprint("expected ')' to match this '('"));
		}

		return expr;
	}

	static ResultTy parseLambda(State& st)
	{
		// we do the syntax desugaring here: \x y z. a b c is \x.\y.\z.(a b c). each
		// parameter after the first is parsed as a lambda without the backslash.

		auto l = st.peek().loc;
		if(st.peek() == TT::Lambda)
			st.pop();

		if(auto x = st.peek(); x != TT::Identifier)
		{
			return make_error(x.loc, x == TT::EndOfFile
				? zpr::sprint("expected identifier, found end of input")
				: zpr::sprint("expected identifier, found '{}'", x.text));
		}

		auto arg = st.pop();

		ResultTy body = make_error({ }, "");
		if(st.match(TT::Period))
		{
			body = parseExpr(st);
		}
		else if(st.peek() == TT::Identifier)
		{
			body = parseLambda(st);
		}
		else
		{
			auto x = st.peek();
			return make_error(x.loc, x == TT::EndOfFile
				? zpr::sprint("expected '.' or identifier; found end of input")
				: zpr::sprint("expected '.' or identifier; found '{}'", x.text));
		}

		if(!body) return body;

		return Ok<ast::Expr*>(new ast::Lambda(span(l, (*body)->loc), arg.loc, arg.text.str(), *body));
	}
}
