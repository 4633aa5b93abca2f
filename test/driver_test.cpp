// driver_test.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include <fstream>
#include <utility>
#include <vector>

#include "helpers.h"

using redex::Context;
using redex::ErrorKind;

static Context quiet_context()
{
	Context ctx { };
	ctx.flags |= redex::FLAG_NO_DIAGNOSTICS;
	return ctx;
}

static std::string result_of(const Context& ctx, const char* src)
{
	auto result = redex::run(ctx, zbuf::str_view(src, strlen(src)));
	if(!result)
		return "<error: " + result.error().msg + ">";

	return *result;
}

static std::string write_temp_file(const char* name, const char* contents)
{
	auto path = testing::TempDir() + name;

	std::ofstream out(path, std::ios::binary);
	out << contents;

	return path;
}

TEST(Run, CommandLineCases)
{
	auto ctx = quiet_context();

	auto cases = std::vector<std::pair<const char*, const char*>> {
		{ "\\x.(\\y.y)x",                   "(\\x.((\\y.y) x))" },
		{ "(\\x.a x) ((\\x.x)b)",           "(a ((\\x.x) b))" },
		{ "(\\x.x) (1--2)",                 "3.0" },
		{ "(\\x.x) (1---2)",                "-1.0" },
		{ "(\\x.x + 1) 5",                  "6.0" },
		{ "(\\x.x * x) 3",                  "9.0" },
		{ "(\\x.\\y.x + y) 3 4",            "7.0" },
		{ "1-2*3-4",                        "-9.0" },
		{ "(\\x.x * x) 2 * 3",              "12.0" },
		{ "(\\x.x * x) (-2) * (-3)",        "-12.0" },
		{ "((\\x.x * x) (-2)) * (-3)",      "-12.0" },
		{ "(\\x.x) (---2)",                 "-2.0" },
		{ "(\\x.x) a",                      "a" },
		{ "(\\x.\\y.x) a b",                "a" },
		{ "(\\x.x) (\\y.y)",                "(\\y.y)" },
		{ "5",                              "5.0" },
		{ "-5",                             "-5.0" },
		{ "--5",                            "5.0" },
		{ "2 + 3",                          "5.0" },
		{ "5 - 3",                          "2.0" },
		{ "2 + 3 * 4",                      "14.0" },
		{ "10 - 2 - 3",                     "5.0" },
		{ "-2 * 3",                         "-6.0" },
		{ "-2 + 3",                         "1.0" },
		{ "(\\x.x + x) 3",                  "6.0" },
		{ "(\\x.\\y.x * y) 4 5",            "20.0" },
		{ "(\\x.x) (2 + 3)",                "5.0" },
		{ "(\\x.x * x + 1) 3",              "10.0" },
		{ "(\\x.\\y.x * y + x) 2 3",        "8.0" },
		{ "(\\x.x) 5 + (\\x.x) 3",          "8.0" },
		{ "0",                              "0.0" },
		{ "-0",                             "0.0" },
		{ "1 - 1",                          "0.0" },
		{ "5 * 0",                          "0.0" },
	};

	for(auto& [ input, expected ] : cases)
		EXPECT_EQ(result_of(ctx, input), expected) << "for input '" << input << "'";
}

TEST(Run, NormalOrderContext)
{
	auto ctx = quiet_context();
	ctx.strategy = redex::Strategy::Eager;

	EXPECT_EQ(result_of(ctx, "\\x.(\\y.y)x"), "(\\x.x)");
	EXPECT_EQ(result_of(ctx, "(\\x.a x) ((\\x.x)b)"), "(a b)");
	EXPECT_EQ(result_of(ctx, "\\x.(\\y.y) (1 + 2)"), "(\\x.3.0)");
}

TEST(Run, PlainContext)
{
	auto ctx = quiet_context();
	ctx.dialect = redex::Dialect::Plain;

	EXPECT_EQ(result_of(ctx, "(\\x.x) (\\y.y)"), "\\y.y");
	EXPECT_EQ(result_of(ctx, "(\\f x.f (f x)) g"), "\\x.g (g x)");
	EXPECT_EQ(result_of(ctx, "1 + 2"), "<error: invalid token '1'>");
}

TEST(Run, Failures)
{
	auto ctx = quiet_context();

	auto parse = redex::run(ctx, "(\\x.x");
	ASSERT_FALSE(parse.ok());
	EXPECT_EQ(parse.error().kind, ErrorKind::Parse);
	EXPECT_EQ(parse.error().msg, "expected ')' to match this '('");

	ctx.max_steps = 50;
	auto omega = redex::run(ctx, "(\\x.x x) (\\x.x x)");
	ASSERT_FALSE(omega.ok());
	EXPECT_EQ(omega.error().kind, ErrorKind::StepLimit);
	EXPECT_EQ(omega.error().msg, "no normal form reached within 50 steps");

	// a budget that's large enough changes nothing.
	EXPECT_EQ(result_of(ctx, "(\\x.x + 1) 5"), "6.0");
}

TEST(Run, Trace)
{
	auto ctx = quiet_context();
	ctx.flags |= redex::FLAG_TRACE;

	testing::internal::CaptureStdout();
	auto result = result_of(ctx, "(\\x.x + 1) 5");
	auto output = testing::internal::GetCapturedStdout();

	EXPECT_EQ(result, "6.0");
	EXPECT_NE(output.find("β-red:"), std::string::npos);
	EXPECT_NE(output.find("5.0 + 1.0"), std::string::npos);
	EXPECT_NE(output.find("fold:"), std::string::npos);
	EXPECT_NE(output.find("done."), std::string::npos);
}

TEST(Run, ExitCodes)
{
	EXPECT_EQ(redex::exit_code(ErrorKind::Usage), 1);
	EXPECT_EQ(redex::exit_code(ErrorKind::Parse), 1);
	EXPECT_EQ(redex::exit_code(ErrorKind::StepLimit), 2);
	EXPECT_EQ(redex::exit_code(ErrorKind::Io), 3);
}

TEST(LoadFile, EvaluatesEveryLine)
{
	auto path = write_temp_file("redex_load_ok.lc",
		"# comments and blank lines are skipped\n"
		"\n"
		"(\\x.x + 1) 5\n"
		"   (\\x.\\y.x) a b   \n"
		"2 * 3");

	auto ctx = quiet_context();

	testing::internal::CaptureStdout();
	auto loaded = redex::loadFile(ctx, path);
	auto output = testing::internal::GetCapturedStdout();

	ASSERT_TRUE(loaded.ok()) << loaded.error().msg;
	EXPECT_EQ(*loaded, 3u);

	EXPECT_NE(output.find("6.0\n"), std::string::npos);
	EXPECT_NE(output.find("a\n"), std::string::npos);
	EXPECT_NE(output.find("6.0\n", output.find("a\n")), std::string::npos);
	EXPECT_NE(output.find("evaluated 3 expressions"), std::string::npos);
}

TEST(LoadFile, CommandsChangeTheContext)
{
	auto path = write_temp_file("redex_load_cmds.lc",
		":s\n"
		"\\x.(\\y.y)x\n");

	auto ctx = quiet_context();

	testing::internal::CaptureStdout();
	auto loaded = redex::loadFile(ctx, path);
	auto output = testing::internal::GetCapturedStdout();

	ASSERT_TRUE(loaded.ok()) << loaded.error().msg;
	EXPECT_EQ(*loaded, 1u);
	EXPECT_EQ(ctx.strategy, redex::Strategy::Eager);
	EXPECT_NE(output.find("(\\x.x)\n"), std::string::npos);
}

TEST(LoadFile, QuitEndsTheFile)
{
	auto path = write_temp_file("redex_load_quit.lc",
		"1 + 1\n"
		":q\n"
		"(x\n");

	auto ctx = quiet_context();

	testing::internal::CaptureStdout();
	auto loaded = redex::loadFile(ctx, path);
	auto output = testing::internal::GetCapturedStdout();

	ASSERT_TRUE(loaded.ok()) << loaded.error().msg;
	EXPECT_EQ(*loaded, 1u);
	EXPECT_NE(output.find("evaluated 1 expression "), std::string::npos);
}

TEST(LoadFile, StopsAtFirstBadLine)
{
	auto path = write_temp_file("redex_load_bad.lc",
		"1 + 1\n"
		"(x\n"
		"2 + 2\n");

	auto ctx = quiet_context();

	testing::internal::CaptureStdout();
	auto loaded = redex::loadFile(ctx, path);
	auto output = testing::internal::GetCapturedStdout();

	ASSERT_FALSE(loaded.ok());
	EXPECT_EQ(loaded.error().kind, ErrorKind::Parse);
	EXPECT_NE(loaded.error().msg.find("(line 2)"), std::string::npos);
	EXPECT_NE(output.find("2.0"), std::string::npos);
	EXPECT_EQ(output.find("4.0"), std::string::npos);
}

TEST(LoadFile, MissingFile)
{
	auto ctx = quiet_context();

	auto loaded = redex::loadFile(ctx, "/nonexistent/redex/file.lc");
	ASSERT_FALSE(loaded.ok());
	EXPECT_EQ(loaded.error().kind, ErrorKind::Io);
	EXPECT_NE(loaded.error().msg.find("failed to open file"), std::string::npos);
}
