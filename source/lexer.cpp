// lexer.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include "ast.h"
#include "defs.h"

#include <utf8proc.h>

namespace parser
{
	using zst::Ok;
	using zst::Err;

	using TT = TokenType;

	static bool is_ascii_letter(char c)
	{
		return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
	}

	static bool is_ascii_digit(char c)
	{
		return '0' <= c && c <= '9';
	}

	static size_t count_digits(zbuf::str_view src, size_t from)
	{
		size_t n = 0;
		while(from + n < src.size() && is_ascii_digit(src.data()[from + n]))
			n++;

		return n;
	}

	// [0-9]+ ('.' [0-9]+)? ([eE] [+-]? [0-9]+)?
	static size_t number_length(zbuf::str_view src)
	{
		size_t len = count_digits(src, 0);

		// a '.' not followed by a digit belongs to whatever comes next.
		if(len < src.size() && src.data()[len] == '.')
		{
			if(auto k = count_digits(src, len + 1); k > 0)
				len += 1 + k;
		}

		if(len < src.size() && (src.data()[len] == 'e' || src.data()[len] == 'E'))
		{
			size_t sign = 0;
			if(len + 1 < src.size() && (src.data()[len + 1] == '+' || src.data()[len + 1] == '-'))
				sign = 1;

			if(auto k = count_digits(src, len + 1 + sign); k > 0)
				len += 1 + sign + k;
		}

		return len;
	}

	static zst::Result<Token, Error> lex_one_token(zbuf::str_view& src, size_t& idx, redex::Dialect dialect)
	{
		// skip all whitespace.
		size_t k = 0;
		while(src.size() > 0 && (k = unicode::is_space(src), k > 0))
		{
			src.remove_prefix(k);
			idx += k;
		}

		if(src.empty())
			return Ok(Token(TT::EndOfFile, Location { idx, 0 }, ""));

		auto take_and_return_taken = [](zbuf::str_view& sv, size_t n) -> zbuf::str_view {
			auto ret = sv.take(n);
			sv.remove_prefix(n);
			return ret;
		};

		size_t cplen = 0;
		auto cp = unicode::get_codepoint(src, &cplen);

		auto arithmetic = (dialect == redex::Dialect::Arithmetic);
		auto first = src.front();

		if(cp == unicode::LAMBDA)
		{
			return Ok(Token(TT::Lambda, Location { idx, cplen }, take_and_return_taken(src, cplen)));
		}
		else if(is_ascii_letter(first))
		{
			size_t len = 1;
			while(len < src.size() && (is_ascii_letter(src.data()[len]) || is_ascii_digit(src.data()[len])))
				len++;

			return Ok(Token(TT::Identifier, Location { idx, len }, take_and_return_taken(src, len)));
		}
		// plain mode has no number literals, so digits end up as invalid tokens.
		else if(is_ascii_digit(first) && arithmetic)
		{
			auto len = number_length(src);
			return Ok(Token(TT::Number, Location { idx, len }, take_and_return_taken(src, len)));
		}
		else
		{
			Token ret;
			auto loc = Location { idx, 1 };

			switch(first)
			{
				case '(': ret = Token(TT::LParen, loc, src.take(1));    break;
				case ')': ret = Token(TT::RParen, loc, src.take(1));    break;
				case '.': ret = Token(TT::Period, loc, src.take(1));    break;
				case '\\': ret = Token(TT::Lambda, loc, src.take(1));   break;

				case '+': ret = Token(TT::Plus, loc, src.take(1));      break;
				case '-': ret = Token(TT::Minus, loc, src.take(1));     break;
				case '*': ret = Token(TT::Asterisk, loc, src.take(1));  break;
				case '/': ret = Token(TT::Slash, loc, src.take(1));     break;

				default: {
					auto sz = unicode::get_codepoint_length(src);
					return Err(Error {
						zpr::sprint("invalid token '{}'", src.take(sz)),
						Location { idx, 1 }
					});
				}
			}

			if(!arithmetic && (ret == TT::Plus || ret == TT::Minus || ret == TT::Asterisk || ret == TT::Slash))
			{
				return Err(Error {
					zpr::sprint("arithmetic operator '{}' is not available in plain mode", ret.text),
					loc
				});
			}

			src.remove_prefix(1);
			return Ok(ret);
		}
	}


	zst::Result<std::vector<Token>, Error> lex(zbuf::str_view src, redex::Dialect dialect)
	{
		std::vector<Token> ret;

		size_t idx = 0;
		while(true)
		{
			auto r = lex_one_token(src, idx, dialect);
			if(!r) return Err(r.error());

			auto tok = r.unwrap();
			if(tok == TT::EndOfFile)
				break;

			ret.push_back(tok);
			idx += tok.text.size();
		}

		return Ok(ret);
	}
}





namespace unicode
{
	int32_t get_codepoint(zbuf::str_view str, size_t* length)
	{
		utf8proc_int32_t cp = -1;
		auto sz = utf8proc_iterate((const uint8_t*) str.data(), str.size(), &cp);

		if(length) *length = (sz > 0 ? static_cast<size_t>(sz) : 1);
		return cp;
	}

	size_t is_category(zbuf::str_view str, const std::initializer_list<int>& categories)
	{
		size_t sz = 0;
		auto cp = get_codepoint(str, &sz);
		if(cp == -1)
			return 0;

		auto cat = utf8proc_category(cp);
		for(auto c : categories)
			if(cat == c)
				return sz;

		return 0;
	}

	size_t get_codepoint_length(zbuf::str_view str)
	{
		size_t sz = 0;
		get_codepoint(str, &sz);

		return sz;
	}

	size_t is_space(zbuf::str_view str)
	{
		auto c = str.front();
		if(c == '\t' || c == '\n' || c == '\r')
			return 1;

		return is_category(str, {
			UTF8PROC_CATEGORY_ZS, UTF8PROC_CATEGORY_ZL, UTF8PROC_CATEGORY_ZP
		});
	}
}
