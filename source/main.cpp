// main.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "ast.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

static void usage(const char* argv0)
{
	zpr::fprintln(stderr, "usage: {} [options] <expression>", argv0);
	zpr::fprintln(stderr, "");
	zpr::fprintln(stderr, "options:");
	zpr::fprintln(stderr, "  -s, --strategy <lazy|normal>   reduction strategy (default: lazy)");
	zpr::fprintln(stderr, "  -p, --plain                    pure lambda calculus, without arithmetic");
	zpr::fprintln(stderr, "  -t, --trace                    print every reduction step");
	zpr::fprintln(stderr, "  -n, --max-steps <N>            give up after N steps (default: never)");
	zpr::fprintln(stderr, "  -f, --file <path>              evaluate each line of a file");
	zpr::fprintln(stderr, "  -i, --interactive              start a repl");
	zpr::fprintln(stderr, "  -h, --help                     show this message");
}

static int fail(const redex::Failure& f)
{
	redex::printError(f.msg);
	return redex::exit_code(f.kind);
}

int main(int argc, char** argv)
{
	redex::Context ctx { };

	const char* expression = nullptr;
	const char* file = nullptr;
	bool interactive = false;

	auto is = [](const char* arg, const char* s, const char* l) {
		return strcmp(arg, s) == 0 || strcmp(arg, l) == 0;
	};

	for(int i = 1; i < argc; i++)
	{
		auto arg = argv[i];

		// options with a value consume the next argument.
		auto value = [&]() -> const char* {
			return i + 1 < argc ? argv[++i] : nullptr;
		};

		if(is(arg, "-h", "--help"))
		{
			usage(argv[0]);
			return 0;
		}
		else if(is(arg, "-p", "--plain"))
		{
			ctx.dialect = redex::Dialect::Plain;
		}
		else if(is(arg, "-t", "--trace"))
		{
			ctx.flags |= redex::FLAG_TRACE;
		}
		else if(is(arg, "-i", "--interactive"))
		{
			interactive = true;
		}
		else if(is(arg, "-s", "--strategy"))
		{
			auto v = value();
			if(v == nullptr)
				return fail({ redex::ErrorKind::Usage, zpr::sprint("'{}' expects an argument", arg) });

			if(strcmp(v, "lazy") == 0)          ctx.strategy = redex::Strategy::LazyNoBinder;
			else if(strcmp(v, "normal") == 0)   ctx.strategy = redex::Strategy::Eager;
			else
				return fail({ redex::ErrorKind::Usage, zpr::sprint("unknown strategy '{}' (expected 'lazy' or 'normal')", v) });
		}
		else if(is(arg, "-n", "--max-steps"))
		{
			auto v = value();
			if(v == nullptr)
				return fail({ redex::ErrorKind::Usage, zpr::sprint("'{}' expects an argument", arg) });

			char* end = nullptr;
			auto n = std::strtoull(v, &end, 10);
			if(*v == '\0' || *end != '\0')
				return fail({ redex::ErrorKind::Usage, zpr::sprint("invalid step count '{}'", v) });

			ctx.max_steps = n;
		}
		else if(is(arg, "-f", "--file"))
		{
			file = value();
			if(file == nullptr)
				return fail({ redex::ErrorKind::Usage, zpr::sprint("'{}' expects an argument", arg) });
		}
		else if(strncmp(arg, "--", 2) == 0 && isalpha(static_cast<unsigned char>(arg[2])))
		{
			// single dashes are left alone, since '-x' and '--5' are expressions.
			return fail({ redex::ErrorKind::Usage, zpr::sprint("unknown option '{}'", arg) });
		}
		else if(expression == nullptr)
		{
			expression = arg;
		}
		else
		{
			usage(argv[0]);
			return fail({ redex::ErrorKind::Usage, "expected exactly one expression" });
		}
	}

	if((expression != nullptr) + (file != nullptr) + interactive != 1)
	{
		usage(argv[0]);
		return redex::exit_code(redex::ErrorKind::Usage);
	}

	if(interactive)
	{
		redex::repl(ctx);
		return 0;
	}

	if(file != nullptr)
	{
		auto loaded = redex::loadFile(ctx, zbuf::str_view(file, strlen(file)));
		if(!loaded)
			return fail(loaded.error());

		return 0;
	}

	auto result = redex::run(ctx, zbuf::str_view(expression, strlen(expression)));
	if(!result)
	{
		// the parser already explained itself.
		if(result.error().kind == redex::ErrorKind::Parse)
			return redex::exit_code(redex::ErrorKind::Parse);

		return fail(result.error());
	}

	zpr::println("{}", *result);
	return 0;
}
