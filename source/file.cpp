// file.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include "ast.h"
#include "defs.h"

#include <stdio.h>
#include <errno.h>
#include <string.h>

static std::vector<std::string> split_lines(zbuf::str_view view);
static zst::Result<std::string, std::string> read_file_raw(zbuf::str_view path);

namespace redex
{
	using zst::Ok;
	using zst::Err;

	// repl.cpp
	zbuf::str_view trim(zbuf::str_view s);
	bool runReplCommand(Context& ctx, zbuf::str_view cmd);

	zst::Result<size_t, Failure> loadFile(Context& ctx, zbuf::str_view path)
	{
		auto contents = read_file_raw(path);
		if(!contents)
			return Err(Failure { ErrorKind::Io, contents.error() });

		auto lines = split_lines(contents.unwrap());

		size_t evaluated = 0;
		for(size_t i = 0; i < lines.size(); i++)
		{
			// skip comments and empty lines
			auto line = trim(lines[i]);
			if(line.empty() || line.front() == '#')
				continue;

			if(line.front() == ':')
			{
				// the rest of the file is ignored.
				if(line == ":q")
					break;

				if(!runReplCommand(ctx, line))
				{
					return Err(Failure { ErrorKind::Usage,
						zpr::sprint("file '{}' not loaded completely (line {}: bad command)", path, i + 1) });
				}

				continue;
			}

			auto result = run(ctx, line);
			if(!result)
			{
				auto err = result.error();
				err.msg = zpr::sprint("file '{}' not loaded completely (line {}): {}", path, i + 1, err.msg);
				return Err(err);
			}

			zpr::println("{}", *result);
			evaluated += 1;
		}

		zpr::println("{}*.{} evaluated {} expression{} from '{}'", BLACK_BOLD, COLOUR_RESET, evaluated,
			evaluated == 1 ? "" : "s", path);

		return Ok(evaluated);
	}
}


static zst::Result<std::string, std::string> read_file_raw(zbuf::str_view path)
{
	FILE* f = fopen(path.str().c_str(), "rb");
	if(f == nullptr)
		return zst::Err(zpr::sprint("failed to open file '{}': {}", path, strerror(errno)));

	std::string input;

	char buf[4096];
	size_t n = 0;
	while((n = fread(buf, 1, sizeof(buf), f)) > 0)
		input.append(buf, n);

	bool failed = ferror(f) != 0;
	fclose(f);

	if(failed)
		return zst::Err(zpr::sprint("failed to read file '{}'", path));

	return zst::Ok(input);
}

static std::vector<std::string> split_lines(zbuf::str_view view)
{
	std::vector<std::string> ret;

	while(!view.empty())
	{
		size_t ln = view.find('\n');

		if(ln != static_cast<size_t>(-1))
		{
			ret.push_back(view.take(ln).str());
			view.remove_prefix(ln + 1);
		}
		else
		{
			break;
		}
	}

	// account for the case when there's no trailing newline, and we still have some stuff stuck in the view.
	if(!view.empty())
		ret.push_back(view.str());

	return ret;
}
