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

#include <vector>
#include <string>
#include <cstdint>
#include <memory>
#include <functional>
#include <iostream>
#include <sstream>
#include <string.h>
#include <type_traits>

// plain byte scan, not constant-time
bool memis0(const void* p, size_t n);
inline void memset0(void* p, size_t n) { memset(p, 0, n); }

// derives the relational operators from a member int cmp(const T&)
#define COMPARISON_VIA_CMP \
	template <typename T> bool operator < (const T& x) const { return cmp(x) < 0; } \
	template <typename T> bool operator > (const T& x) const { return cmp(x) > 0; } \
	template <typename T> bool operator <= (const T& x) const { return cmp(x) <= 0; } \
	template <typename T> bool operator >= (const T& x) const { return cmp(x) >= 0; } \
	template <typename T> bool operator == (const T& x) const { return cmp(x) == 0; } \
	template <typename T> bool operator != (const T& x) const { return cmp(x) != 0; }

namespace warden
{
	typedef uint64_t Amount;
	typedef std::vector<uint8_t> ByteBuffer;

	template <uint32_t nBytes_>
	struct uintBig_t;

	// Non-owning view of a byte range. Seeds, messages, key material
	struct Blob
	{
		const void* p = nullptr;
		uint32_t n = 0;

		Blob() = default;
		Blob(const void* p_, uint32_t n_) :p(p_), n(n_) {}
		Blob(const ByteBuffer& bb) :p(bb.data()), n(static_cast<uint32_t>(bb.size())) {}
		Blob(const std::string& s) :p(s.data()), n(static_cast<uint32_t>(s.size())) {}

		template <uint32_t nBytes_>
		Blob(const uintBig_t<nBytes_>& x) :p(x.m_pData), n(x.nBytes) {}

		// drops the terminating 0 of a literal
		template <uint32_t n_>
		static Blob FromSz(const char(&sz)[n_]) { return Blob(sz, n_ - 1); }

		void Export(ByteBuffer&) const;
	};
}

namespace std
{
	// 2nd argument by value, static integral constants may have no definition
	template <typename TDst, typename TSrc>
	inline void setmax(TDst& a, TSrc b) {
		if (a < b)
			a = b;
	}

	template <typename TDst, typename TSrc>
	inline void setmin(TDst& a, TSrc b) {
		if (a > b)
			a = b;
	}
}
