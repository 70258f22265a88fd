// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include "exc.h"
#include <type_traits>
#include <limits>

namespace warden {
namespace Strict {

	// The target is modified only if the operation succeeds

	template <typename T>
	inline void Add(T& a, const T& b)
	{
		static_assert(std::is_unsigned_v<T>, "must be unsigned");

		T res = a + b;
		Exc::Test(res >= b, ErrorKind::Overflow);
		a = res;
	}

	template <typename T>
	inline void Sub(T& a, const T& b)
	{
		static_assert(std::is_unsigned_v<T>, "must be unsigned");

		Exc::Test(a >= b, ErrorKind::InsufficientFunds);
		a -= b;
	}

	template <typename T>
	inline void Mul(T& a, const T& b)
	{
		static_assert(std::is_unsigned_v<T>, "must be unsigned");

		Exc::Test(!a || (b <= std::numeric_limits<T>::max() / a), ErrorKind::Overflow);
		a *= b;
	}

	template <typename T>
	inline T Sum(T a, const T& b)
	{
		Add(a, b);
		return a;
	}

	template <typename T>
	inline T Product(T a, const T& b)
	{
		Mul(a, b);
		return a;
	}

} // namespace Strict
} // namespace warden
