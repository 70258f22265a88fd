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

#include "curve.h"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <memory>
#include <stdexcept>

namespace warden {
namespace Curve {

namespace
{
	struct BnFree { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
	struct BnCtxFree { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
	struct GroupFree { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
	struct PointFree { void operator()(EC_POINT* p) const { EC_POINT_clear_free(p); } };

	typedef std::unique_ptr<BIGNUM, BnFree> Bn;
	typedef std::unique_ptr<EC_POINT, PointFree> PointPtr;

	void TestOk(bool b, const char* sz)
	{
		if (!b)
		{
			ERR_clear_error();
			throw std::runtime_error(sz);
		}
	}

	// secp256k1 group and scratch, created once per thread
	struct Context
	{
		static Context& get()
		{
			static thread_local Context s_Ctx;
			return s_Ctx;
		}

		std::unique_ptr<BN_CTX, BnCtxFree> m_pCtx;
		std::unique_ptr<EC_GROUP, GroupFree> m_pGroup;
		const BIGNUM* m_pOrder;
		Bn m_pPrime;

		Context()
			:m_pCtx(BN_CTX_new())
			,m_pGroup(EC_GROUP_new_by_curve_name(NID_secp256k1))
		{
			TestOk(m_pCtx && m_pGroup, "secp256k1 init");
			m_pOrder = EC_GROUP_get0_order(m_pGroup.get());
			TestOk(m_pOrder, "secp256k1 order");

			m_pPrime = NewBn();
			TestOk(EC_GROUP_get_curve(m_pGroup.get(), m_pPrime.get(), nullptr, nullptr, m_pCtx.get()), "secp256k1 field");
		}

		Bn NewBn() const
		{
			Bn p(BN_new());
			TestOk(!!p, "bn alloc");
			return p;
		}

		PointPtr NewPoint() const
		{
			PointPtr p(EC_POINT_new(m_pGroup.get()));
			TestOk(!!p, "point alloc");
			return p;
		}

		Bn Import(const uintBig_t<32>& x) const
		{
			Bn p(BN_bin2bn(x.m_pData, x.nBytes, nullptr));
			TestOk(!!p, "bn import");
			return p;
		}

		void Export(uintBig_t<32>& x, const BIGNUM* p) const
		{
			TestOk(BN_bn2binpad(p, x.m_pData, x.nBytes) == (int) x.nBytes, "bn export");
		}

		// reduces modulo the group order, false if the result is zero
		bool ImportScalar(BIGNUM* pRes, const uintBig_t<32>& x) const
		{
			Bn p = Import(x);
			TestOk(BN_nnmod(pRes, p.get(), m_pOrder, m_pCtx.get()), "bn mod");
			return !BN_is_zero(pRes);
		}

		// lift_x with even y
		bool LiftX(EC_POINT* pRes, const uintBig_t<32>& x) const
		{
			Bn pX = Import(x);
			if (BN_cmp(pX.get(), m_pPrime.get()) >= 0)
				return false;

			if (!EC_POINT_set_compressed_coordinates(m_pGroup.get(), pRes, pX.get(), 0, m_pCtx.get()))
			{
				ERR_clear_error();
				return false;
			}
			return true;
		}

		// returns true if y is odd
		bool GetX(uintBig_t<32>& x, const EC_POINT* p) const
		{
			Bn pX = NewBn(), pY = NewBn();
			TestOk(EC_POINT_get_affine_coordinates(m_pGroup.get(), p, pX.get(), pY.get(), m_pCtx.get()), "point coordinates");
			Export(x, pX.get());
			return BN_is_odd(pY.get());
		}

		void MulG(EC_POINT* pRes, const BIGNUM* pK) const
		{
			TestOk(EC_POINT_mul(m_pGroup.get(), pRes, pK, nullptr, nullptr, m_pCtx.get()), "point mul");
		}

		void Negate(BIGNUM* pK) const
		{
			TestOk(BN_sub(pK, m_pOrder, pK), "bn sub");
		}

		void get_Challenge(BIGNUM* pRes, const uintBig_t<32>& noncePub, const PeerID& pk, const Hash::Value& msg) const
		{
			Hash::Value hv;
			Hash::Processor()
				<< "warden.sig"
				<< noncePub
				<< pk
				<< msg
				>> hv;

			Bn p = Import(hv);
			TestOk(BN_nnmod(pRes, p.get(), m_pOrder, m_pCtx.get()), "bn mod");
		}
	};

} // namespace

bool IsValidX(const uintBig_t<32>& x)
{
	Context& ctx = Context::get();
	PointPtr p = ctx.NewPoint();
	return ctx.LiftX(p.get(), x);
}

int Signature::cmp(const Signature& x) const
{
	int n = m_NoncePub.cmp(x.m_NoncePub);
	if (n)
		return n;
	return m_k.cmp(x.m_k);
}

bool Signature::IsValid(const Hash::Value& msg, const PeerID& pk) const
{
	Context& ctx = Context::get();

	PointPtr pPk = ctx.NewPoint();
	if (!ctx.LiftX(pPk.get(), pk))
		return false;

	Bn k = ctx.Import(m_k);
	if (BN_cmp(k.get(), ctx.m_pOrder) >= 0)
		return false;

	Bn e = ctx.NewBn();
	ctx.get_Challenge(e.get(), m_NoncePub, pk, msg);
	ctx.Negate(e.get());

	// R = k*G - e*P
	PointPtr pR = ctx.NewPoint();
	TestOk(EC_POINT_mul(ctx.m_pGroup.get(), pR.get(), k.get(), pPk.get(), e.get(), ctx.m_pCtx.get()), "point mul");

	if (EC_POINT_is_at_infinity(ctx.m_pGroup.get(), pR.get()))
		return false;

	uintBig_t<32> x;
	if (ctx.GetX(x, pR.get()))
		return false; // odd y

	return x == m_NoncePub;
}

KeyPair::KeyPair(const Blob& seed)
{
	Context& ctx = Context::get();
	Bn sk = ctx.NewBn();

	Hash::Value hv;
	Hash::Processor() << "warden.key" << seed >> hv;

	while (!ctx.ImportScalar(sk.get(), hv))
		Hash::Processor() << "warden.key.retry" << hv >> hv;

	PointPtr pPk = ctx.NewPoint();
	ctx.MulG(pPk.get(), sk.get());

	if (ctx.GetX(m_ID, pPk.get()))
		ctx.Negate(sk.get());

	ctx.Export(m_Sk, sk.get());
	OPENSSL_cleanse(hv.m_pData, hv.nBytes);
}

KeyPair::~KeyPair()
{
	OPENSSL_cleanse(m_Sk.m_pData, m_Sk.nBytes);
}

void KeyPair::Sign(Signature& sig, const Hash::Value& msg) const
{
	Context& ctx = Context::get();

	Bn sk = ctx.Import(m_Sk);
	Bn k = ctx.NewBn();

	// deterministic nonce
	Hash::Value hv;
	Hash::Processor() << "warden.nonce" << m_Sk << msg >> hv;
	while (!ctx.ImportScalar(k.get(), hv))
		Hash::Processor() << "warden.nonce.retry" << hv >> hv;

	PointPtr pR = ctx.NewPoint();
	ctx.MulG(pR.get(), k.get());
	if (ctx.GetX(sig.m_NoncePub, pR.get()))
		ctx.Negate(k.get());

	Bn e = ctx.NewBn();
	ctx.get_Challenge(e.get(), sig.m_NoncePub, m_ID, msg);

	// k += e * sk
	TestOk(BN_mod_mul(e.get(), e.get(), sk.get(), ctx.m_pOrder, ctx.m_pCtx.get()), "bn mul");
	TestOk(BN_mod_add(k.get(), k.get(), e.get(), ctx.m_pOrder, ctx.m_pCtx.get()), "bn add");

	ctx.Export(sig.m_k, k.get());
	OPENSSL_cleanse(hv.m_pData, hv.nBytes);
}

} // namespace Curve
} // namespace warden
