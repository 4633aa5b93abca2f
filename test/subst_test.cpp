// subst_test.cpp
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#include "helpers.h"

using helpers::Owned;
using helpers::show;
using Names = std::set<std::string>;

TEST(FreshName, FirstUnusedCandidate)
{
	EXPECT_EQ(redex::fresh_name({ }), "Var1");
	EXPECT_EQ(redex::fresh_name({ "x", "y" }), "Var1");
	EXPECT_EQ(redex::fresh_name({ "Var1", "Var2" }), "Var3");
	EXPECT_EQ(redex::fresh_name({ "Var2" }), "Var1");
}

TEST(FreshName, DependsOnlyOnUsedSet)
{
	Names used = { "Var1", "a", "Var3" };
	auto first = redex::fresh_name(used);

	// generating names in between must not affect later results.
	for(int i = 0; i < 10; i++)
		(void) redex::fresh_name({ "q" });

	EXPECT_EQ(first, "Var2");
	EXPECT_EQ(redex::fresh_name(used), first);
}

TEST(Substitute, ReplacesMatchingVariable)
{
	auto t = Owned(ast::var("x"));
	auto r = helpers::parse("f a");

	auto out = Owned(redex::substitute(t.get(), "x", r.get()));
	EXPECT_EQ(show(out.get()), "f a");

	auto miss = Owned(redex::substitute(t.get(), "y", r.get()));
	EXPECT_EQ(show(miss.get()), "x");
}

TEST(Substitute, ShadowedBinderIsUntouched)
{
	auto t = helpers::parse("\\x.x y");
	auto r = Owned(ast::var("z"));

	auto out = Owned(redex::substitute(t.get(), "x", r.get()));
	EXPECT_EQ(show(out.get()), "\\x.(x y)");
}

TEST(Substitute, RenamesBinderToAvoidCapture)
{
	// (\y.x y)[x := y] must not become \y.y y
	auto t = Owned(ast::lambda("y", ast::apply(ast::var("x"), ast::var("y"))));
	auto r = Owned(ast::var("y"));

	auto out = Owned(redex::substitute(t.get(), "x", r.get()));
	EXPECT_EQ(show(out.get()), "\\Var1.(y Var1)");
	EXPECT_EQ(redex::free_variables(out.get()), Names({ "y" }));
}

TEST(Substitute, FreshNameAvoidsBodyFreeVariables)
{
	auto t = helpers::parse("\\y.x y Var1");
	auto r = Owned(ast::var("y"));

	auto out = Owned(redex::substitute(t.get(), "x", r.get()));
	EXPECT_EQ(show(out.get()), "\\Var2.(y Var2 Var1)");
}

TEST(Substitute, NoRenameWithoutCaptureRisk)
{
	auto t = helpers::parse("\\y.x y");
	auto r = helpers::parse("a b");

	auto out = Owned(redex::substitute(t.get(), "x", r.get()));
	EXPECT_EQ(show(out.get()), "\\y.(a b y)");
}

TEST(Substitute, ValueIsNotEvaluated)
{
	auto t = helpers::parse("f x x");
	auto r = helpers::parse("(\\z.z) b");

	auto out = Owned(redex::substitute(t.get(), "x", r.get()));
	EXPECT_EQ(show(out.get()), "f ((\\z.z) b) ((\\z.z) b)");
}

TEST(Substitute, InputsAreLeftIntact)
{
	auto t = helpers::parse("\\y.x y");
	auto r = Owned(ast::var("y"));

	auto before = show(t.get());
	auto out = Owned(redex::substitute(t.get(), "x", r.get()));

	EXPECT_EQ(show(t.get()), before);
	EXPECT_EQ(show(r.get()), "y");
	EXPECT_NE(out.get(), t.get());
}

TEST(Substitute, ThroughArithmetic)
{
	auto t = helpers::parse("x + -x * 2");
	auto r = Owned(ast::number(3));

	auto out = Owned(redex::substitute(t.get(), "x", r.get()));
	EXPECT_EQ(show(out.get()), "3.0 + ((-3.0) * 2.0)");
}

TEST(Substitute, FreeVariableLaw)
{
	// fv(t[x := r]) == (fv(t) - {x}) + (x in fv(t) ? fv(r) : {})
	const char* terms[] = {
		"x", "y", "\\x.x", "\\y.x y", "\\y.\\z.x y z w", "(\\x.x) x", "x + \\q.q x", "-(f x)", "3",
	};

	const char* values[] = {
		"y", "x", "a b", "\\y.y", "y z", "Var1", "1 + w",
	};

	for(auto ts : terms)
	{
		for(auto rs : values)
		{
			auto t = helpers::parse(ts);
			auto r = helpers::parse(rs);

			auto expected = redex::free_variables(t.get());
			bool had_x = expected.erase("x") > 0;
			if(had_x)
			{
				auto fr = redex::free_variables(r.get());
				expected.insert(fr.begin(), fr.end());
			}

			auto out = Owned(redex::substitute(t.get(), "x", r.get()));
			EXPECT_EQ(redex::free_variables(out.get()), expected) << ts << " [x := " << rs << "]";
		}
	}
}
