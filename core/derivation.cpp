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

#include "derivation.h"
#include "curve.h"
#include "exc.h"
#include "utility/logger.h"

namespace warden
{
	Derivation::Derivation()
		:m_Controller(Zero)
	{
	}

	Derivation::Derivation(const PeerID& controller)
		:m_Controller(controller)
	{
	}

	Derivation& Derivation::operator << (const Blob& seed)
	{
		Exc::Test(m_vSeeds.size() < s_MaxSeeds, ErrorKind::InvalidArgument);
		Exc::Test(seed.n <= s_MaxSeedSize, ErrorKind::InvalidArgument);

		m_vSeeds.emplace_back();
		seed.Export(m_vSeeds.back());
		return *this;
	}

	void Derivation::TestLimits() const
	{
		Exc::Test(m_vSeeds.size() <= s_MaxSeeds, ErrorKind::InvalidArgument);

		for (const auto& seed : m_vSeeds)
			Exc::Test(seed.size() <= s_MaxSeedSize, ErrorKind::InvalidArgument);
	}

	bool Derivation::CreateAddress(Address& addr, uint8_t nBump) const
	{
		TestLimits();

		Hash::Processor hp;
		hp
			<< "warden.pda"
			<< static_cast<uint32_t>(m_vSeeds.size());

		for (const auto& seed : m_vSeeds)
			hp
				<< static_cast<uint32_t>(seed.size())
				<< Blob(seed);

		hp
			<< nBump
			<< m_Controller
			>> addr;

		return !Curve::IsValidX(addr);
	}

	uint8_t Derivation::Find(Address& addr) const
	{
		for (uint32_t i = 0x100; i--; )
		{
			uint8_t nBump = static_cast<uint8_t>(i);
			if (CreateAddress(addr, nBump))
			{
				LOG_DEBUG() << "derived " << addr << " bump=" << static_cast<uint32_t>(nBump) << " tries=" << (0x100 - i);
				return nBump;
			}
		}

		// all 256 candidates are curve points. Practically impossible
		Exc::Fail(ErrorKind::InvalidDerivation, "no valid bump");
	}

	void Derivation::Verify(const Address& candidate, uint8_t nBump) const
	{
		Exc::CheckpointTxt cp("derivation/verify");

		Address addr;
		bool bValid = CreateAddress(addr, nBump);
		Exc::Test(bValid && (addr == candidate), ErrorKind::InvalidDerivation);

		// any valid bump above the supplied one takes precedence
		for (uint32_t i = 0xff; i > nBump; i--)
			Exc::Test(!CreateAddress(addr, static_cast<uint8_t>(i)), ErrorKind::NonCanonicalBump);
	}

} // namespace warden
