// ast.h
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <vector>

#include "defs.h"

namespace ast
{
	struct Expr;
}

namespace parser
{
	struct Location
	{
		size_t begin;
		size_t length;
	};

	struct Error
	{
		std::string msg;
		Location loc;
	};

	enum class TokenType
	{
		Invalid,

		LParen,
		RParen,
		Period,
		Lambda,

		Plus,
		Minus,
		Asterisk,
		Slash,

		Identifier,
		Number,
		EndOfFile,
	};

	struct Token
	{
		Token() { }
		Token(TokenType t, Location loc, zbuf::str_view s) : loc(loc), text(s), type(t) { }

		Location loc;
		zbuf::str_view text;
		TokenType type = TokenType::Invalid;

		operator TokenType() const { return this->type; }
	};

	zst::Result<ast::Expr*, Error> parse(zbuf::str_view input, redex::Dialect dialect);
	zst::Result<std::vector<Token>, Error> lex(zbuf::str_view input, redex::Dialect dialect);
}

namespace ast
{
	enum class Kind
	{
		Var,
		Apply,
		Lambda,
		Number,
		BinOp,
		Negate,
	};

	enum class Op
	{
		Plus,
		Minus,
		Times,
		Div,
	};

	// terms are never modified after construction; every transformation builds a new
	// tree. each node owns its children.
	struct Expr
	{
		Expr(Kind k, parser::Location l) : kind(k), loc(l) { }
		virtual ~Expr();

		Expr(const Expr&) = delete;
		Expr& operator= (const Expr&) = delete;

		virtual Expr* clone() const = 0;

		const Kind kind;
		const parser::Location loc;
	};

	struct Var : Expr
	{
		Var(parser::Location loc, std::string s) : Expr(KIND, loc), name(std::move(s)) { }
		virtual ~Var() override;
		virtual Var* clone() const override;

		static constexpr Kind KIND = Kind::Var;

		const std::string name;
	};

	struct Apply : Expr
	{
		Apply(parser::Location loc, const Expr* fn, const Expr* arg) : Expr(KIND, loc), fn(fn), arg(arg) { }
		virtual ~Apply() override;
		virtual Apply* clone() const override;

		static constexpr Kind KIND = Kind::Apply;

		const Expr* const fn;
		const Expr* const arg;
	};

	struct Lambda : Expr
	{
		Lambda(parser::Location loc, parser::Location argloc, std::string arg, const Expr* body) : Expr(KIND, loc),
			argloc(argloc), arg(std::move(arg)), body(body) { }

		virtual ~Lambda() override;
		virtual Lambda* clone() const override;

		static constexpr Kind KIND = Kind::Lambda;

		const parser::Location argloc;
		const std::string arg;
		const Expr* const body;
	};

	struct Number : Expr
	{
		Number(parser::Location loc, double value) : Expr(KIND, loc), value(value) { }
		virtual ~Number() override;
		virtual Number* clone() const override;

		static constexpr Kind KIND = Kind::Number;

		const double value;
	};

	struct BinOp : Expr
	{
		BinOp(parser::Location loc, Op op, const Expr* lhs, const Expr* rhs) : Expr(KIND, loc),
			op(op), lhs(lhs), rhs(rhs) { }

		virtual ~BinOp() override;
		virtual BinOp* clone() const override;

		static constexpr Kind KIND = Kind::BinOp;

		const Op op;
		const Expr* const lhs;
		const Expr* const rhs;
	};

	struct Negate : Expr
	{
		Negate(parser::Location loc, const Expr* operand) : Expr(KIND, loc), operand(operand) { }
		virtual ~Negate() override;
		virtual Negate* clone() const override;

		static constexpr Kind KIND = Kind::Negate;

		const Expr* const operand;
	};

	template <typename T>
	const T* as(const Expr* expr)
	{
		return expr->kind == T::KIND ? static_cast<const T*>(expr) : nullptr;
	}

	// for building terms outside the parser; these have no source location.
	Var* var(std::string name);
	Apply* apply(const Expr* fn, const Expr* arg);
	Lambda* lambda(std::string arg, const Expr* body);
	Number* number(double value);
	BinOp* binop(Op op, const Expr* lhs, const Expr* rhs);
	Negate* negate(const Expr* operand);
}
