// result.h
// Copyright (c) 2021, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <new>
#include <assert.h>

namespace zst
{
	template <typename T>
	struct Ok
	{
		Ok(Ok&&) = delete;
		Ok(const Ok&) = delete;

		Ok(T&& value) : m_value(static_cast<T&&>(value)) { }
		Ok(const T& value) : m_value(value) { }

		template <typename, typename> friend struct Result;

	private:
		T m_value;
	};

	template <typename E>
	struct Err
	{
		Err(Err&&) = delete;
		Err(const Err&) = delete;

		Err(E&& error) : m_error(static_cast<E&&>(error)) { }
		Err(const E& error) : m_error(error) { }

		template <typename, typename> friend struct Result;

	private:
		E m_error;
	};

	// either a value or an error, never both. a moved-from result holds neither.
	template <typename T, typename E>
	struct Result
	{
		using value_type = T;
		using error_type = E;

		template <typename T1 = T>
		Result(Ok<T1>&& ok) : state(STATE_VAL) { new (&this->val) T(static_cast<T1&&>(ok.m_value)); }

		template <typename E1 = E>
		Result(Err<E1>&& err) : state(STATE_ERR) { new (&this->err) E(static_cast<E1&&>(err.m_error)); }

		Result(const Result& other) : state(other.state)
		{
			if(this->state == STATE_VAL) new (&this->val) T(other.val);
			if(this->state == STATE_ERR) new (&this->err) E(other.err);
		}

		Result(Result&& other) : state(other.state)
		{
			if(this->state == STATE_VAL) new (&this->val) T(static_cast<T&&>(other.val));
			if(this->state == STATE_ERR) new (&this->err) E(static_cast<E&&>(other.err));

			other.destroy();
		}

		Result& operator= (const Result& other)
		{
			if(this != &other)
			{
				this->destroy();
				this->state = other.state;
				if(this->state == STATE_VAL) new (&this->val) T(other.val);
				if(this->state == STATE_ERR) new (&this->err) E(other.err);
			}
			return *this;
		}

		Result& operator= (Result&& other)
		{
			if(this != &other)
			{
				this->destroy();
				this->state = other.state;
				if(this->state == STATE_VAL) new (&this->val) T(static_cast<T&&>(other.val));
				if(this->state == STATE_ERR) new (&this->err) E(static_cast<E&&>(other.err));

				other.destroy();
			}
			return *this;
		}

		~Result() { this->destroy(); }

		operator bool() const { return this->state == STATE_VAL; }
		bool ok() const { return this->state == STATE_VAL; }

		T* operator -> () { assert(this->state == STATE_VAL); return &this->val; }
		const T* operator -> () const { assert(this->state == STATE_VAL); return &this->val; }

		T& operator* () { assert(this->state == STATE_VAL); return this->val; }
		const T& operator* () const { assert(this->state == STATE_VAL); return this->val; }

		T& unwrap() { assert(this->state == STATE_VAL); return this->val; }
		const T& unwrap() const { assert(this->state == STATE_VAL); return this->val; }

		E& error() { assert(this->state == STATE_ERR); return this->err; }
		const E& error() const { assert(this->state == STATE_ERR); return this->err; }

	private:
		static constexpr int STATE_NONE = 0;
		static constexpr int STATE_VAL  = 1;
		static constexpr int STATE_ERR  = 2;

		void destroy()
		{
			if(this->state == STATE_VAL) this->val.~T();
			if(this->state == STATE_ERR) this->err.~E();

			this->state = STATE_NONE;
		}

		int state = STATE_NONE;
		union {
			T val;
			E err;
		};
	};
}
