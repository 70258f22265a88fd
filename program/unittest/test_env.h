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
#include "../processor.h"

namespace warden
{
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

	// Processor over an in-memory store, with funded key identities
	struct TestEnv
	{
		static const Amount s_WalletInitial = 5000;

		MemStore m_Store;
		CallRouter m_Router;
		TrustedTargets m_Trusted;

		Curve::KeyPair m_kpAdmin;
		Curve::KeyPair m_kpA;
		Curve::KeyPair m_kpB;

		PeerID m_Controller;
		Processor m_Proc;

		static PeerID MakeController()
		{
			PeerID id;
			Hash::Processor() << "test.controller" >> id;
			return id;
		}

		TestEnv()
			:m_kpAdmin(Blob::FromSz("admin"))
			,m_kpA(Blob::FromSz("alice"))
			,m_kpB(Blob::FromSz("bob"))
			,m_Controller(MakeController())
			,m_Proc(m_Store, m_Router, m_Trusted, m_Controller, m_kpAdmin.get_ID())
		{
			m_Store.SetWallet(m_kpA.get_ID(), s_WalletInitial);
			m_Store.SetWallet(m_kpB.get_ID(), s_WalletInitial);
		}

		// context with a verified signature of the key over a per-call message
		static AuthContext SignedBy(const Curve::KeyPair& kp)
		{
			AuthContext ctx;
			AddSigned(ctx, kp);
			return ctx;
		}

		static void AddSigned(AuthContext& ctx, const Curve::KeyPair& kp)
		{
			static uint32_t s_Nonce = 0;

			Hash::Value msg;
			Hash::Processor() << "test.op" << ++s_Nonce >> msg;

			Curve::Signature sig;
			kp.Sign(sig, msg);
			ctx.AddVerified(kp.get_ID(), msg, sig);
		}

		Vault get_Vault(const Address& addr)
		{
			Account acc;
			m_Store.Get(addr, acc);

			Vault v;
			Records::Load(v, acc, m_Controller);
			return v;
		}

		UserAccount get_User(const Address& addr)
		{
			Account acc;
			m_Store.Get(addr, acc);

			UserAccount u;
			Records::Load(u, acc, m_Controller);
			return u;
		}

		Amount get_Value(const Address& addr)
		{
			Account acc;
			m_Store.Get(addr, acc);
			return acc.m_Value;
		}

		bool IsLive(const Address& addr)
		{
			Account acc;
			return m_Store.Get(addr, acc);
		}
	};

} // namespace warden
