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

#include <iostream>
#include "../derivation.h"
#include "../curve.h"
#include "../exc.h"

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

#define fail_test(msg) TestFailed(msg, __LINE__)

namespace warden {

	template <typename TFn>
	ErrorKind::Enum CatchKind(TFn&& fn)
	{
		try {
			fn();
		}
		catch (const Exc& e) {
			return e.m_Kind;
		}
		return ErrorKind::None;
	}

	PeerID MakeID(uint8_t n)
	{
		PeerID id = Zero;
		id.m_pData[0] = 0xa5;
		id.m_pData[31] = n;
		return id;
	}

	void TestHash()
	{
		// FIPS 180-2 test vector
		Hash::Value hv;
		Hash::Processor hp;
		hp.Write("abc", 3);
		hp >> hv;

		Hash::Value hvRef;
		verify_test(hvRef.Scan("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
		verify_test(hv == hvRef);

		// varint encoding is width-independent
		Hash::Value hv1, hv2;
		Hash::Processor() << uint8_t(5) >> hv1;
		Hash::Processor() << uint64_t(5) >> hv2;
		verify_test(hv1 == hv2);

		Hash::Processor() << uint64_t(0x80) >> hv1;
		Hash::Processor() << uint8_t(0x80) >> hv2;
		verify_test(hv1 != hv2);

		// truncated output is the digest prefix
		uintBig_t<8> tag;
		Hash::Processor() << "tag" >> tag;
		Hash::Processor() << "tag" >> hv1;
		verify_test(!memcmp(tag.m_pData, hv1.m_pData, tag.nBytes));
	}

	void TestDeterminism()
	{
		Derivation d1(MakeID(1)), d2(MakeID(1)), d3(MakeID(2));
		d1 << "vault" << Blob(MakeID(7));
		d2 << "vault" << Blob(MakeID(7));
		d3 << "vault" << Blob(MakeID(7));

		Address a1, a2, a3;
		uint8_t b1 = d1.Find(a1);
		uint8_t b2 = d2.Find(a2);
		uint8_t b3 = d3.Find(a3);

		verify_test(a1 == a2);
		verify_test(b1 == b2);
		verify_test(a1 != a3); // controller is part of the preimage
		(void) b3;

		// canonical address is never a curve point
		verify_test(!Curve::IsValidX(a1));

		d1.Verify(a1, b1);
	}

	void TestSeedBoundaries()
	{
		// concatenation of seeds must not collide
		Derivation d1(MakeID(1)), d2(MakeID(1));
		d1 << "ab" << "c";
		d2 << "a" << "bc";

		Address a1, a2;
		d1.Find(a1);
		d2.Find(a2);
		verify_test(a1 != a2);

		// empty seed is still a seed
		Derivation d3(MakeID(1)), d4(MakeID(1));
		d3 << "ab";
		d4 << "ab" << "";
		Address a3, a4;
		d3.Find(a3);
		d4.Find(a4);
		verify_test(a3 != a4);
	}

	void TestLimits()
	{
		Derivation d(MakeID(3));
		for (uint32_t i = 0; i < Derivation::s_MaxSeeds; i++)
			d << "s";

		verify_test(CatchKind([&] { d << "s"; }) == ErrorKind::InvalidArgument);
		verify_test(d.m_vSeeds.size() == Derivation::s_MaxSeeds);

		uint8_t pBuf[Derivation::s_MaxSeedSize + 1] = { 0 };
		Derivation d2(MakeID(3));
		d2 << Blob(pBuf, Derivation::s_MaxSeedSize);
		verify_test(CatchKind([&] { d2 << Blob(pBuf, sizeof(pBuf)); }) == ErrorKind::InvalidArgument);

		// limits are re-checked when seeds were filled directly
		Derivation d3(MakeID(3));
		d3.m_vSeeds.resize(1);
		d3.m_vSeeds[0].resize(Derivation::s_MaxSeedSize + 1);
		Address addr;
		verify_test(CatchKind([&] { d3.Find(addr); }) == ErrorKind::InvalidArgument);
	}

	void TestCanonicalBump()
	{
		bool bNonCanonicalSeen = false;
		bool bCurvePointSeen = false;

		for (uint8_t iCtl = 0; iCtl < 8; iCtl++)
		{
			Derivation d(MakeID(iCtl));
			d << "user" << Blob(MakeID(0x33));

			Address addr0;
			uint8_t nBump0 = d.Find(addr0);

			// the canonical bump is the first valid one from the top
			for (uint32_t i = 0xff; i > nBump0; i--)
			{
				Address addr;
				verify_test(!d.CreateAddress(addr, static_cast<uint8_t>(i)));
			}

			verify_test(CatchKind([&] { d.Verify(addr0, nBump0); }) == ErrorKind::None);

			// right bump, wrong address
			Address addrBad = addr0;
			addrBad.m_pData[5] ^= 1;
			verify_test(CatchKind([&] { d.Verify(addrBad, nBump0); }) == ErrorKind::InvalidDerivation);

			for (uint32_t i = nBump0; i--; )
			{
				uint8_t nBump = static_cast<uint8_t>(i);
				Address addr;
				if (d.CreateAddress(addr, nBump))
				{
					// valid, but not canonical
					verify_test(CatchKind([&] { d.Verify(addr, nBump); }) == ErrorKind::NonCanonicalBump);
					// canonical address with a wrong bump
					verify_test(CatchKind([&] { d.Verify(addr0, nBump); }) == ErrorKind::InvalidDerivation);
					bNonCanonicalSeen = true;
				}
				else
				{
					// a curve point is never accepted
					verify_test(CatchKind([&] { d.Verify(addr, nBump); }) == ErrorKind::InvalidDerivation);
					bCurvePointSeen = true;
				}
			}
		}

		verify_test(bNonCanonicalSeen);
		verify_test(bCurvePointSeen);
	}

	void TestAll()
	{
		TestHash();
		TestDeterminism();
		TestSeedBoundaries();
		TestLimits();
		TestCanonicalBump();
	}

} // namespace warden

int main()
{
	try
	{
		warden::TestAll();
	}
	catch (const std::exception& ex)
	{
		printf("Expression: %s\n", ex.what());
		g_TestsFailed++;
	}

	return g_TestsFailed ? -1 : 0;
}
