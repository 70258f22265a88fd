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
#include "hash.h"
#include "types.h"

namespace warden
{
	namespace Curve
	{
		// true iff x is the x-coordinate of some secp256k1 point
		bool IsValidX(const uintBig_t<32>& x);

		// Schnorr's signature, nonce point is normalized to even y, so only its x is stored
		struct Signature
		{
			uintBig_t<32> m_NoncePub;
			uintBig_t<32> m_k;

			bool IsValid(const Hash::Value& msg, const PeerID& pk) const;

			int cmp(const Signature&) const;
			COMPARISON_VIA_CMP
		};

		class KeyPair
		{
			uintBig_t<32> m_Sk;
			PeerID m_ID;

		public:
			// deterministic from the seed
			explicit KeyPair(const Blob& seed);
			~KeyPair();

			const PeerID& get_ID() const { return m_ID; }

			void Sign(Signature&, const Hash::Value& msg) const;
		};

	} // namespace Curve

} // namespace warden
