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
#include "test_env.h"

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

	// Borrows, optionally re-enters the same loan, then repays from its own wallet
	struct Borrower
		:public ICallTarget
	{
		TestEnv& m_Env;
		Curve::KeyPair m_Kp;

		const Curve::KeyPair* m_pReenterAs = nullptr;
		const Address* m_pRelayVault = nullptr; // runs the validator callback there, signed by B
		Amount m_Repay = 0;
		CallStatus::Enum m_eStatus = CallStatus::Ok;

		// observed inside the call
		uint32_t m_nCalls = 0;
		bool m_bLockedSeen = false;
		Amount m_BalanceSeen = 0;
		ErrorKind::Enum m_eNested = ErrorKind::None;

		Borrower(TestEnv& env)
			:m_Env(env)
			,m_Kp(Blob::FromSz("borrower"))
		{
		}

		const PeerID& get_ID() const { return m_Kp.get_ID(); }

		CallStatus::Enum Invoke(const CallArgs& args) override
		{
			m_nCalls++;

			Vault v = m_Env.get_Vault(args.m_Vault);
			m_bLockedSeen = v.IsLocked();
			m_BalanceSeen = v.m_Balance;

			if (m_pReenterAs)
				m_eNested = CatchKind([&] {
					m_Env.m_Proc.FlashLoan(TestEnv::SignedBy(*m_pReenterAs), m_pReenterAs->get_ID(), args.m_Vault, get_ID(), args.m_Amount, args.m_Fee);
				});

			if (m_pRelayVault)
			{
				const Curve::KeyPair& kpB = m_Env.m_kpB;
				m_Env.m_Proc.ExecuteCallback(TestEnv::SignedBy(kpB), kpB.get_ID(), *m_pRelayVault, *m_Env.m_Trusted.Find(TrustedTargets::s_szValidator), ByteBuffer());
			}

			if (m_Repay)
				m_Env.m_Proc.Deposit(TestEnv::SignedBy(m_Kp), get_ID(), args.m_Vault, m_Repay);

			return m_eStatus;
		}
	};

	// Trusted target that misbehaves on request
	struct Counterparty
		:public ICallTarget
	{
		enum struct Mode {
			Honest,
			DepositBack,
			TryWithdraw,
			TryClose, // not caught
			OverwriteAuthority,
			DropLock,
			Fail,
		};

		TestEnv& m_Env;
		PeerID m_ID;
		Mode m_Mode = Mode::Honest;

		ByteBuffer m_DataSeen;
		ErrorKind::Enum m_eNested = ErrorKind::None;

		Counterparty(TestEnv& env, const PeerID& id)
			:m_Env(env)
			,m_ID(id)
		{
			env.m_Router.Register(id, *this);
		}

		void Overwrite(const Address& addr, const std::function<void(Vault&, Account&)>& fn)
		{
			Account acc;
			m_Env.m_Store.Get(addr, acc);
			Vault v;
			Records::Load(v, acc, m_Env.m_Controller);
			fn(v, acc);
			Records::Save(acc, v);
			m_Env.m_Store.Put(addr, acc);
		}

		CallStatus::Enum Invoke(const CallArgs& args) override
		{
			m_DataSeen = args.m_Data;
			const Curve::KeyPair& kpA = m_Env.m_kpA;

			switch (m_Mode)
			{
			case Mode::DepositBack:
				{
					AuthContext ctx;
					ctx.AddSigned(m_ID);
					m_Env.m_Proc.Deposit(ctx, m_ID, args.m_Vault, 5);
				}
				break;

			case Mode::TryWithdraw:
				m_eNested = CatchKind([&] { m_Env.m_Proc.Withdraw(TestEnv::SignedBy(kpA), kpA.get_ID(), args.m_Vault, 1); });
				break;

			case Mode::TryClose:
				m_Env.m_Proc.CloseVault(TestEnv::SignedBy(kpA), kpA.get_ID(), args.m_Vault, kpA.get_ID());
				break;

			case Mode::OverwriteAuthority:
				Overwrite(args.m_Vault, [&](Vault& v, Account&) { v.m_Authority = m_ID; });
				break;

			case Mode::DropLock:
				Overwrite(args.m_Vault, [](Vault& v, Account&) { v.m_Locked = 0; });
				break;

			case Mode::Fail:
				return CallStatus::Failed;

			default:
				break;
			}

			return CallStatus::Ok;
		}
	};

	// Validator that goes back for another vault's flash loan, i.e. one level deeper than the borrower
	struct LoanReentry
		:public ICallTarget
	{
		TestEnv& m_Env;
		PeerID m_ID;
		Address m_Vault;
		PeerID m_Borrower;
		bool m_bCatch = true;

		uint32_t m_DepthSeen = 0;
		Vault m_vSeen;
		ErrorKind::Enum m_eNested = ErrorKind::None;

		LoanReentry(TestEnv& env, const PeerID& id, const Address& vault, const PeerID& borrower)
			:m_Env(env)
			,m_ID(id)
			,m_Vault(vault)
			,m_Borrower(borrower)
		{
			env.m_Router.Register(id, *this);
		}

		CallStatus::Enum Invoke(const CallArgs&) override
		{
			m_DepthSeen = m_Env.m_Router.get_Depth();
			m_vSeen = m_Env.get_Vault(m_Vault);

			const Curve::KeyPair& kpA = m_Env.m_kpA;
			auto fn = [&] { m_Env.m_Proc.FlashLoan(TestEnv::SignedBy(kpA), kpA.get_ID(), m_Vault, m_Borrower, 100, 1); };

			if (m_bCatch)
				m_eNested = CatchKind(fn);
			else
				fn();

			return CallStatus::Ok;
		}
	};

	struct Recursive
		:public ICallTarget
	{
		CallRouter& m_Router;
		PeerID m_ID;
		uint32_t m_nCalls = 0;
		uint32_t m_MaxDepthSeen = 0;

		Recursive(CallRouter& r, const PeerID& id) :m_Router(r), m_ID(id) {}

		CallStatus::Enum Invoke(const CallArgs& args) override
		{
			m_nCalls++;
			std::setmax(m_MaxDepthSeen, m_Router.get_Depth());
			return m_Router.Invoke(m_ID, args);
		}
	};

	void TestFlashLoanScenario()
	{
		TestEnv env;
		const PeerID& idA = env.m_kpA.get_ID();

		Address addr = env.m_Proc.InitializeVault(env.SignedBy(env.m_kpA), idA, 1000);

		Borrower b(env);
		env.m_Store.SetWallet(b.get_ID(), 50);
		env.m_Router.Register(b.get_ID(), b);
		env.m_Proc.BindCallback(env.SignedBy(env.m_kpA), idA, addr, b.get_ID());

		b.m_pReenterAs = &env.m_kpA;
		b.m_Repay = 101;

		env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 100, 1);

		verify_test(b.m_nCalls == 1); // the nested loan never reached the target
		verify_test(b.m_bLockedSeen);
		verify_test(b.m_BalanceSeen == 900);
		verify_test(b.m_eNested == ErrorKind::Reentrant);

		Vault v = env.get_Vault(addr);
		verify_test(!v.IsLocked());
		verify_test(v.m_Balance == 1001);
		verify_test(env.get_Value(addr) == 1001);
		verify_test(env.get_Value(b.get_ID()) == 49);
		verify_test(!env.m_Router.get_Depth());
	}

	void TestNestedReentry()
	{
		TestEnv env;
		const PeerID& idA = env.m_kpA.get_ID();
		const PeerID& idB = env.m_kpB.get_ID();

		Address addr1 = env.m_Proc.InitializeVault(env.SignedBy(env.m_kpA), idA, 1000);
		Address addr2 = env.m_Proc.InitializeVault(env.SignedBy(env.m_kpB), idB, 500);

		Borrower b(env);
		env.m_Store.SetWallet(b.get_ID(), 50);
		env.m_Router.Register(b.get_ID(), b);
		env.m_Proc.BindCallback(env.SignedBy(env.m_kpA), idA, addr1, b.get_ID());

		LoanReentry validator(env, *env.m_Trusted.Find(TrustedTargets::s_szValidator), addr1, b.get_ID());

		b.m_pRelayVault = &addr2;
		b.m_Repay = 101;

		// the re-entry two calls down is refused, the outer loan completes
		env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr1, b.get_ID(), 100, 1);

		verify_test(validator.m_DepthSeen == 2);
		verify_test(validator.m_eNested == ErrorKind::Reentrant);
		verify_test(validator.m_vSeen.IsLocked());
		verify_test(validator.m_vSeen.m_Balance == 900);
		verify_test(b.m_nCalls == 1);

		Vault v1 = env.get_Vault(addr1);
		verify_test(!v1.IsLocked());
		verify_test(v1.m_Balance == 1001);
		verify_test(env.get_Value(addr1) == 1001);
		verify_test(env.get_Value(b.get_ID()) == 49);

		Vault v2 = env.get_Vault(addr2);
		verify_test(!v2.IsLocked());
		verify_test(v2.m_Balance == 500);
		verify_test(!env.m_Router.get_Depth());

		// left unhandled, it takes down everything above it
		validator.m_bCatch = false;
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr1, b.get_ID(), 100, 1); }) == ErrorKind::Reentrant);
		verify_test(b.m_nCalls == 2);

		v1 = env.get_Vault(addr1);
		verify_test(!v1.IsLocked());
		verify_test(v1.m_Balance == 1001);
		verify_test(v1.m_Authority == idA);
		verify_test(env.get_Value(addr1) == 1001);
		verify_test(env.get_Value(b.get_ID()) == 49);
		verify_test(!env.get_Vault(addr2).IsLocked());
		verify_test(env.get_Vault(addr2).m_Balance == 500);
		verify_test(!env.m_Router.get_Depth());
	}

	void TestFlashLoanFailures()
	{
		TestEnv env;
		const PeerID& idA = env.m_kpA.get_ID();
		const PeerID& idB = env.m_kpB.get_ID();

		Address addr = env.m_Proc.InitializeVault(env.SignedBy(env.m_kpA), idA, 1000);

		Borrower b(env);
		env.m_Store.SetWallet(b.get_ID(), 50);
		env.m_Router.Register(b.get_ID(), b);

		auto fnCheckIntact = [&]() {
			Vault v = env.get_Vault(addr);
			verify_test(!v.IsLocked());
			verify_test(v.m_Balance == 1000);
			verify_test(env.get_Value(addr) == 1000);
			verify_test(env.get_Value(b.get_ID()) == 50);
		};

		// not bound yet, not on the allow-list
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 100, 1); }) == ErrorKind::InvalidProgram);
		verify_test(!b.m_nCalls);
		fnCheckIntact();

		env.m_Proc.BindCallback(env.SignedBy(env.m_kpA), idA, addr, b.get_ID());

		// the loan can't be redirected to an arbitrary target
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, idB, 100, 1); }) == ErrorKind::InvalidProgram);

		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 0, 1); }) == ErrorKind::InvalidAmount);
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 1001, 1); }) == ErrorKind::InsufficientFunds);
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpB), idB, addr, b.get_ID(), 100, 1); }) == ErrorKind::Unauthorized);
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 100, static_cast<Amount>(-1)); }) == ErrorKind::Overflow);
		verify_test(!b.m_nCalls);
		fnCheckIntact();

		// principal without the fee
		b.m_Repay = 100;
		ErrorKind::Enum eKind = CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 100, 1); });
		verify_test(eKind == ErrorKind::NotRepaid);
		verify_test(ErrorKind::IsInvariantViolation(eKind));
		verify_test(b.m_nCalls == 1);
		fnCheckIntact();

		// nothing returned
		b.m_Repay = 0;
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 100, 1); }) == ErrorKind::NotRepaid);
		fnCheckIntact();

		// repaid, but the target reports failure
		b.m_Repay = 101;
		b.m_eStatus = CallStatus::Failed;
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 100, 1); }) == ErrorKind::CallbackFailed);
		fnCheckIntact();

		// bound, but nothing is there to answer
		Curve::KeyPair kpGhost(Blob::FromSz("ghost"));
		env.m_Proc.BindCallback(env.SignedBy(env.m_kpA), idA, addr, kpGhost.get_ID());
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, kpGhost.get_ID(), 100, 0); }) == ErrorKind::CallbackFailed);
		verify_test(env.get_Value(kpGhost.get_ID()) == 0);
		fnCheckIntact();

		// rebinding revoked the borrower
		b.m_eStatus = CallStatus::Ok;
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, b.get_ID(), 100, 1); }) == ErrorKind::InvalidProgram);
	}

	void TestSwap()
	{
		TestEnv env;
		const PeerID& idA = env.m_kpA.get_ID();

		Address addr = env.m_Proc.InitializeVault(env.SignedBy(env.m_kpA), idA, 1000);

		Counterparty dex(env, *env.m_Trusted.Find(TrustedTargets::s_szDex));
		Counterparty validator(env, *env.m_Trusted.Find(TrustedTargets::s_szValidator));

		env.m_Proc.SwapTokens(env.SignedBy(env.m_kpA), idA, addr, dex.m_ID, 100);
		verify_test(env.get_Vault(addr).m_Balance == 900);
		verify_test(env.get_Value(addr) == 900);
		verify_test(env.get_Value(dex.m_ID) == 100);

		// role is specific
		verify_test(CatchKind([&] { env.m_Proc.SwapTokens(env.SignedBy(env.m_kpA), idA, addr, validator.m_ID, 100); }) == ErrorKind::InvalidProgram);

		// even a bound callback is not a dex
		Curve::KeyPair kpC(Blob::FromSz("carol"));
		env.m_Proc.BindCallback(env.SignedBy(env.m_kpA), idA, addr, kpC.get_ID());
		verify_test(CatchKind([&] { env.m_Proc.SwapTokens(env.SignedBy(env.m_kpA), idA, addr, kpC.get_ID(), 100); }) == ErrorKind::InvalidProgram);

		// the balance must not move during the call, not even up
		dex.m_Mode = Counterparty::Mode::DepositBack;
		verify_test(CatchKind([&] { env.m_Proc.SwapTokens(env.SignedBy(env.m_kpA), idA, addr, dex.m_ID, 100); }) == ErrorKind::UnexpectedStateChange);
		verify_test(env.get_Vault(addr).m_Balance == 900);
		verify_test(env.get_Value(dex.m_ID) == 100);

		// nested withdraw is locked out, the swap itself goes through
		dex.m_Mode = Counterparty::Mode::TryWithdraw;
		env.m_Proc.SwapTokens(env.SignedBy(env.m_kpA), idA, addr, dex.m_ID, 50);
		verify_test(dex.m_eNested == ErrorKind::Reentrant);
		verify_test(env.get_Vault(addr).m_Balance == 850);
		verify_test(!env.get_Vault(addr).IsLocked());

		// any trusted target may take a flash loan
		dex.m_Mode = Counterparty::Mode::Honest;
		verify_test(CatchKind([&] { env.m_Proc.FlashLoan(env.SignedBy(env.m_kpA), idA, addr, dex.m_ID, 10, 0); }) == ErrorKind::NotRepaid);
		verify_test(CatchKind([&] { env.m_Proc.SwapTokens(env.SignedBy(env.m_kpA), idA, addr, dex.m_ID, 0); }) == ErrorKind::InvalidAmount);
	}

	void TestExecuteCallback()
	{
		TestEnv env;
		const PeerID& idA = env.m_kpA.get_ID();

		Address addr = env.m_Proc.InitializeVault(env.SignedBy(env.m_kpA), idA, 1000);

		Counterparty dex(env, *env.m_Trusted.Find(TrustedTargets::s_szDex));
		Counterparty validator(env, *env.m_Trusted.Find(TrustedTargets::s_szValidator));

		ByteBuffer data = { 1, 2, 3 };
		env.m_Proc.ExecuteCallback(env.SignedBy(env.m_kpA), idA, addr, validator.m_ID, data);
		verify_test(validator.m_DataSeen == data);
		verify_test(!env.get_Vault(addr).IsLocked());

		verify_test(CatchKind([&] { env.m_Proc.ExecuteCallback(env.SignedBy(env.m_kpA), idA, addr, dex.m_ID, data); }) == ErrorKind::InvalidProgram);
		verify_test(CatchKind([&] { env.m_Proc.ExecuteCallback(env.SignedBy(env.m_kpB), env.m_kpB.get_ID(), addr, validator.m_ID, data); }) == ErrorKind::Unauthorized);

		auto fnCheckIntact = [&]() {
			Vault v = env.get_Vault(addr);
			verify_test(!v.IsLocked());
			verify_test(v.m_Balance == 1000);
			verify_test(v.m_Authority == idA);
			verify_test(env.IsLive(addr));
			verify_test(!env.m_Router.get_Depth());
		};

		validator.m_Mode = Counterparty::Mode::Fail;
		verify_test(CatchKind([&] { env.m_Proc.ExecuteCallback(env.SignedBy(env.m_kpA), idA, addr, validator.m_ID, data); }) == ErrorKind::CallbackFailed);
		fnCheckIntact();

		// closing from inside aborts the whole operation
		validator.m_Mode = Counterparty::Mode::TryClose;
		verify_test(CatchKind([&] { env.m_Proc.ExecuteCallback(env.SignedBy(env.m_kpA), idA, addr, validator.m_ID, data); }) == ErrorKind::Reentrant);
		fnCheckIntact();

		// state changed behind the controller's back
		validator.m_Mode = Counterparty::Mode::OverwriteAuthority;
		verify_test(CatchKind([&] { env.m_Proc.ExecuteCallback(env.SignedBy(env.m_kpA), idA, addr, validator.m_ID, data); }) == ErrorKind::UnexpectedStateChange);
		fnCheckIntact();

		validator.m_Mode = Counterparty::Mode::DropLock;
		verify_test(CatchKind([&] { env.m_Proc.ExecuteCallback(env.SignedBy(env.m_kpA), idA, addr, validator.m_ID, data); }) == ErrorKind::InvariantViolated);
		fnCheckIntact();
	}

	void TestPostCallInvariant()
	{
		Vault vCall;
		vCall.m_Balance = 100;
		vCall.m_Locked = 1;

		PostCallInvariant inv;
		inv.Verify(vCall, vCall, 100);

		Vault v = vCall;
		v.m_Balance = 101;
		verify_test(CatchKind([&] { inv.Verify(vCall, v, 101); }) == ErrorKind::UnexpectedStateChange);

		inv.m_eBalance = PostCallInvariant::Balance::AtLeast;
		inv.m_Reference = 101;
		inv.Verify(vCall, v, 101);
		verify_test(CatchKind([&] { inv.Verify(vCall, vCall, 100); }) == ErrorKind::NotRepaid);
		verify_test(CatchKind([&] { inv.Verify(vCall, v, 100); }) == ErrorKind::InvariantViolated);

		v.m_Callback.m_pData[0] = 1;
		verify_test(CatchKind([&] { inv.Verify(vCall, v, 101); }) == ErrorKind::UnexpectedStateChange);
	}

	void TestRouter()
	{
		CallRouter r;
		PeerID id;
		Hash::Processor() << "recursive" >> id;

		CallArgs args;
		verify_test(r.Invoke(id, args) == CallStatus::Unknown);

		Recursive x(r, id);
		r.Register(id, x);

		verify_test(r.Invoke(id, args) == CallStatus::Failed);
		verify_test(x.m_nCalls == CallRouter::s_MaxDepth);
		verify_test(x.m_MaxDepthSeen == CallRouter::s_MaxDepth);
		verify_test(!r.get_Depth());

		r.Unregister(id);
		verify_test(r.Invoke(id, args) == CallStatus::Unknown);
	}

	void TestTrustedTargets()
	{
		TrustedTargets tDef;
		const PeerID* pDex = tDef.Find(TrustedTargets::s_szDex);
		verify_test(pDex && tDef.IsTrustedAny(*pDex));
		verify_test(tDef.Find(TrustedTargets::s_szValidator));
		verify_test(!tDef.Find("oracle"));

		PeerID idDex, idOracle;
		Hash::Processor() << "dex2" >> idDex;
		Hash::Processor() << "oracle" >> idOracle;

		Config cfg;
		cfg.set("trusted_targets", Config::StringList{ "dex:" + idDex.str(), "oracle:" + idOracle.str() });

		TrustedTargets t(cfg);
		verify_test(t.IsTrusted(TrustedTargets::s_szDex, idDex));
		verify_test(!t.IsTrusted(TrustedTargets::s_szDex, *pDex));
		verify_test(!t.IsTrustedAny(*pDex));
		verify_test(t.IsTrusted("oracle", idOracle));
		verify_test(!t.IsTrusted(TrustedTargets::s_szValidator, idOracle));
		verify_test(t.get_Roles().size() == 3);

		bool bThrown = false;
		try {
			Config cfgBad;
			cfgBad.set("trusted_targets", Config::StringList{ "dex" });
			TrustedTargets tBad(cfgBad);
		}
		catch (const std::runtime_error&) {
			bThrown = true;
		}
		verify_test(bThrown);

		bThrown = false;
		try {
			Config cfgBad;
			cfgBad.set("trusted_targets", Config::StringList{ "dex:xyz" });
			TrustedTargets tBad(cfgBad);
		}
		catch (const std::runtime_error&) {
			bThrown = true;
		}
		verify_test(bThrown);
	}

	void TestAll()
	{
		TestFlashLoanScenario();
		TestNestedReentry();
		TestFlashLoanFailures();
		TestSwap();
		TestExecuteCallback();
		TestPostCallInvariant();
		TestRouter();
		TestTrustedTargets();
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
