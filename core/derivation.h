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
#include "types.h"
#include <vector>

namespace warden
{
	// Program-derived address: a deterministic location that is not a curve point, hence has no private key.
	//
	//	addr(bump) = SHA-256("warden.pda" | nSeeds | (len | seed)* | bump | controller)
	//
	// Integers are varint-encoded. The canonical bump is the first one, scanning from 255 down to 0, that gives a valid address.
	struct Derivation
	{
		static const uint32_t s_MaxSeeds = 16;
		static const uint32_t s_MaxSeedSize = 32;

		std::vector<ByteBuffer> m_vSeeds;
		PeerID m_Controller;

		Derivation();
		explicit Derivation(const PeerID& controller);

		// appends a seed, fails with InvalidArgument if the limits are exceeded
		Derivation& operator << (const Blob&);

		template <uint32_t n>
		Derivation& operator << (const char(&sz)[n]) { return operator << (Blob::FromSz(sz)); }

		void TestLimits() const;

		// returns false if the resulting address is a curve point
		bool CreateAddress(Address&, uint8_t nBump) const;

		// canonical address, returns its bump
		uint8_t Find(Address&) const;

		// InvalidDerivation if the candidate isn't the valid address for this bump, NonCanonicalBump if another bump is canonical
		void Verify(const Address& candidate, uint8_t nBump) const;
	};

} // namespace warden
