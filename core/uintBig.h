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
#include "utility/common.h"
#include "utility/hex.h"
#include <string>
#include <string_view>

namespace warden
{
	// Syntactic sugar!
	enum Zero_ { Zero };

	// Fixed-width big-endian byte string. Identities, addresses and digests, no arithmetics
	template <uint32_t nBytes_>
	struct uintBig_t
	{
		static const uint32_t nBytes = nBytes_;

		uint8_t m_pData[nBytes];

		uintBig_t() {}

		uintBig_t(Zero_)
		{
			memset0(m_pData, nBytes);
		}

		uintBig_t(const uint8_t p[nBytes])
		{
			memcpy(m_pData, p, nBytes);
		}

		uintBig_t& operator = (Zero_)
		{
			memset0(m_pData, nBytes);
			return *this;
		}

		bool operator == (Zero_) const { return memis0(m_pData, nBytes); }
		bool operator != (Zero_) const { return !memis0(m_pData, nBytes); }

		int cmp(const uintBig_t& x) const
		{
			return memcmp(m_pData, x.m_pData, nBytes);
		}

		COMPARISON_VIA_CMP

		std::string str() const
		{
			return to_hex(m_pData, nBytes);
		}

		// exactly 2*nBytes hex digits, optional "0x" prefix. Leaves the value intact on failure
		bool Scan(std::string_view s)
		{
			return from_hex_fixed(m_pData, nBytes, s);
		}

		template <typename Archive>
		void serialize(Archive& ar) const
		{
			ar & m_pData;
		}

		template <typename Archive>
		void serialize(Archive& ar)
		{
			ar & m_pData;
		}

		friend std::ostream& operator << (std::ostream& s, const uintBig_t& x)
		{
			return s << x.str();
		}
	};

} // namespace warden
