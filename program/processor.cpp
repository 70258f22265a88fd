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

#include "processor.h"
#include "core/strict.h"
#include "utility/logger.h"

namespace warden
{
	Processor::Processor(IStore& s, IDelegation& d, const TrustedTargets& t, const PeerID& controller, const PeerID& admin)
		:m_Store(s)
		,m_Controller(controller)
		,m_Admin(admin)
		,m_Mediator(s, d, t, m_Controller)
		,m_Closure(s, m_Controller)
	{
	}

	void Processor::Run(const char* szOp, const std::function<void()>& fn)
	{
		Exc::CheckpointTxt cp(szOp);
		IStore::Mark mark = m_Store.get_Mark();

		try {
			fn();
		}
		catch (const Exc& e) {
			m_Store.Rollback(mark);
			LOG_WARNING() << szOp << " rolled back: " << e.m_Kind;
			throw;
		}
		catch (const std::exception& e) {
			m_Store.Rollback(mark);
			LOG_WARNING() << szOp << " rolled back: " << e.what();
			throw;
		}

		LOG_INFO() << szOp << " ok";
	}

	Derivation Processor::get_UserDerivation(const PeerID& authority) const
	{
		Derivation d(m_Controller);
		d << "user" << authority;
		return d;
	}

	Derivation Processor::get_VaultDerivation(const PeerID& creator) const
	{
		Derivation d(m_Controller);
		d << "vault" << creator;
		return d;
	}

	void Processor::ValidateUser(const Address& addr, UserAccount& u, Account& acc)
	{
		m_Store.Get(addr, acc);
		Records::Load(u, acc, m_Controller);
		get_UserDerivation(u.m_Authority).Verify(addr, u.m_Bump);
	}

	void Processor::ValidateVault(const Address& addr, Vault& v, Account& acc)
	{
		m_Store.Get(addr, acc);
		Records::Load(v, acc, m_Controller);
		get_VaultDerivation(v.m_Creator).Verify(addr, v.m_Bump);
	}

	void Processor::LoadWallet(const Address& addr, Account& acc)
	{
		m_Store.Get(addr, acc);
		Exc::Test((acc.m_Owner == s_SystemID) && acc.m_Data.empty(), ErrorKind::InvalidDestination);
	}

	void Processor::CreditWallet(const Address& addr, Amount val)
	{
		Account acc;
		LoadWallet(addr, acc);
		Strict::Add(acc.m_Value, val);
		m_Store.Put(addr, acc);
	}

	void Processor::DebitWallet(const Address& addr, Amount val)
	{
		Account acc;
		LoadWallet(addr, acc);
		Strict::Sub(acc.m_Value, val);
		m_Store.Put(addr, acc);
	}

	Address Processor::Allocate(const Derivation& d, uint8_t& nBump)
	{
		Address addr;
		nBump = d.Find(addr);

		Account acc;
		Exc::Test(!m_Store.Get(addr, acc), ErrorKind::AlreadyInUse);
		return addr;
	}

	///////////////////////
	// Users

	void Processor::CreditPoints(UserAccount& u, Amount val)
	{
		Strict::Add(u.m_Points, val);
		Exc::Test(u.m_Points <= UserAccount::s_PointsMax, ErrorKind::ExceedsMaxSupply);
	}

	Address Processor::InitializeUser(const AuthContext& ctx, const PeerID& authority, const std::string& szName)
	{
		Address addr;
		Run("InitializeUser", [&]() {
			Auth::RequireSigner(ctx, authority);

			UserAccount u;
			u.m_Authority = authority;
			u.set_Name(szName);

			addr = Allocate(get_UserDerivation(authority), u.m_Bump);

			Account acc;
			acc.m_Owner = m_Controller;
			SaveRecord(addr, acc, u);
		});
		return addr;
	}

	void Processor::GrantPoints(const AuthContext& ctx, const PeerID& admin, const Address& user, Amount val)
	{
		Run("GrantPoints", [&]() {
			Exc::Test(admin == m_Admin, ErrorKind::Unauthorized);
			Auth::RequireSigner(ctx, admin);

			UserAccount u;
			Account acc;
			ValidateUser(user, u, acc);

			CreditPoints(u, val);
			SaveRecord(user, acc, u);
		});
	}

	void Processor::TransferPoints(const AuthContext& ctx, const PeerID& authority, const Address& from, const Address& to, Amount val)
	{
		Run("TransferPoints", [&]() {
			Exc::Test(from != to, ErrorKind::InvalidArgument);

			UserAccount uSrc, uDst;
			Account accSrc, accDst;
			ValidateUser(from, uSrc, accSrc);
			ValidateUser(to, uDst, accDst);

			Auth::RequireAuthority(ctx, uSrc.m_Authority, authority);

			Strict::Sub(uSrc.m_Points, val);
			CreditPoints(uDst, val);

			SaveRecord(from, accSrc, uSrc);
			SaveRecord(to, accDst, uDst);
		});
	}

	void Processor::BurnPoints(const AuthContext& ctx, const PeerID& authority, const Address& user, Amount val)
	{
		Run("BurnPoints", [&]() {
			Exc::Test(val != 0, ErrorKind::InvalidAmount);

			UserAccount u;
			Account acc;
			ValidateUser(user, u, acc);

			Auth::RequireAuthority(ctx, u.m_Authority, authority);

			Strict::Sub(u.m_Points, val);
			SaveRecord(user, acc, u);
		});
	}

	Amount Processor::CalculateReward(const AuthContext& ctx, const PeerID& authority, const Address& user, Amount val, Amount rate, uint32_t feeBps)
	{
		Amount net = 0;
		Run("CalculateReward", [&]() {
			Exc::Test(feeBps <= s_BpsMax, ErrorKind::InvalidFeeBps);

			UserAccount u;
			Account acc;
			ValidateUser(user, u, acc);

			Auth::RequireAuthority(ctx, u.m_Authority, authority);

			Amount reward = Strict::Product(val, rate);
			Amount fee = Strict::Product(reward, static_cast<Amount>(feeBps)) / s_BpsMax;

			net = reward;
			Strict::Sub(net, fee);

			CreditPoints(u, net);
			SaveRecord(user, acc, u);

			LOG_DEBUG() << "reward " << reward << " fee " << fee;
		});
		return net;
	}

	///////////////////////
	// Vaults

	Address Processor::InitializeVault(const AuthContext& ctx, const PeerID& authority, Amount initial)
	{
		Address addr;
		Run("InitializeVault", [&]() {
			Auth::RequireSigner(ctx, authority);

			Vault v;
			v.m_Creator = authority;
			v.m_Authority = authority;
			v.m_Balance = initial;

			addr = Allocate(get_VaultDerivation(authority), v.m_Bump);

			DebitWallet(authority, initial);

			Account acc;
			acc.m_Owner = m_Controller;
			acc.m_Value = initial;
			SaveRecord(addr, acc, v);
		});
		return addr;
	}

	void Processor::Deposit(const AuthContext& ctx, const PeerID& depositor, const Address& vault, Amount val)
	{
		Run("Deposit", [&]() {
			Exc::Test(val != 0, ErrorKind::InvalidAmount);
			Auth::RequireSigner(ctx, depositor);

			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);

			// allowed while locked, this is how a borrower repays
			Strict::Add(v.m_Balance, val);
			Strict::Add(acc.m_Value, val);

			DebitWallet(depositor, val);
			SaveRecord(vault, acc, v);
		});
	}

	void Processor::Withdraw(const AuthContext& ctx, const PeerID& authority, const Address& vault, Amount val)
	{
		Run("Withdraw", [&]() {
			Exc::Test(val != 0, ErrorKind::InvalidAmount);

			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);
			Exc::Test(!v.IsLocked(), ErrorKind::Reentrant);

			Auth::RequireAuthority(ctx, v.m_Authority, authority);

			Strict::Sub(v.m_Balance, val);
			Strict::Sub(acc.m_Value, val);

			SaveRecord(vault, acc, v);
			CreditWallet(v.m_Authority, val);
		});
	}

	void Processor::Transfer(const AuthContext& ctx, const PeerID& authority, const Address& from, const Address& to, Amount val)
	{
		Run("Transfer", [&]() {
			Exc::Test(val != 0, ErrorKind::InvalidAmount);
			Exc::Test(from != to, ErrorKind::InvalidArgument);

			Vault vSrc, vDst;
			Account accSrc, accDst;
			ValidateVault(from, vSrc, accSrc);
			ValidateVault(to, vDst, accDst);
			Exc::Test(!vSrc.IsLocked() && !vDst.IsLocked(), ErrorKind::Reentrant);

			Auth::RequireAuthority(ctx, vSrc.m_Authority, authority);

			Strict::Sub(vSrc.m_Balance, val);
			Strict::Sub(accSrc.m_Value, val);
			Strict::Add(vDst.m_Balance, val);
			Strict::Add(accDst.m_Value, val);

			SaveRecord(from, accSrc, vSrc);
			SaveRecord(to, accDst, vDst);
		});
	}

	void Processor::ChangeAuthority(const AuthContext& ctx, const PeerID& authority, const Address& vault, const PeerID& newAuthority)
	{
		Run("ChangeAuthority", [&]() {
			Exc::Test(newAuthority != Zero, ErrorKind::InvalidArgument);

			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);
			Exc::Test(!v.IsLocked(), ErrorKind::Reentrant);

			Auth::RequireAuthority(ctx, v.m_Authority, authority);

			v.m_Authority = newAuthority;
			SaveRecord(vault, acc, v);
		});
	}

	void Processor::BindCallback(const AuthContext& ctx, const PeerID& authority, const Address& vault, const PeerID& target)
	{
		Run("BindCallback", [&]() {
			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);
			Exc::Test(!v.IsLocked(), ErrorKind::Reentrant);

			Auth::RequireAuthority(ctx, v.m_Authority, authority);

			v.m_Callback = target;
			SaveRecord(vault, acc, v);
		});
	}

	///////////////////////
	// Guarded delegations

	void Processor::FlashLoan(const AuthContext& ctx, const PeerID& authority, const Address& vault, const PeerID& target, Amount val, Amount fee)
	{
		Run("FlashLoan", [&]() {
			Exc::Test(val != 0, ErrorKind::InvalidAmount);

			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);
			Exc::Test(!v.IsLocked(), ErrorKind::Reentrant);

			Auth::RequireAuthority(ctx, v.m_Authority, authority);

			PostCallInvariant inv;
			inv.m_eBalance = PostCallInvariant::Balance::AtLeast;
			inv.m_Reference = Strict::Sum(v.m_Balance, fee);

			CallArgs args;
			args.m_Controller = m_Controller;
			args.m_Vault = vault;
			args.m_Amount = val;
			args.m_Fee = fee;

			m_Mediator.Call(vault, target, nullptr, args, inv, [&](Vault& vLocked, Account& accLocked) {
				Strict::Sub(vLocked.m_Balance, val);
				Strict::Sub(accLocked.m_Value, val);
				CreditWallet(target, val);
			});
		});
	}

	void Processor::SwapTokens(const AuthContext& ctx, const PeerID& authority, const Address& vault, const PeerID& dex, Amount val)
	{
		Run("SwapTokens", [&]() {
			Exc::Test(val != 0, ErrorKind::InvalidAmount);

			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);
			Exc::Test(!v.IsLocked(), ErrorKind::Reentrant);

			Auth::RequireAuthority(ctx, v.m_Authority, authority);

			CallArgs args;
			args.m_Controller = m_Controller;
			args.m_Vault = vault;
			args.m_Amount = val;

			m_Mediator.Call(vault, dex, TrustedTargets::s_szDex, args, PostCallInvariant(), [&](Vault& vLocked, Account& accLocked) {
				Strict::Sub(vLocked.m_Balance, val);
				Strict::Sub(accLocked.m_Value, val);
				CreditWallet(dex, val);
			});
		});
	}

	void Processor::ExecuteCallback(const AuthContext& ctx, const PeerID& authority, const Address& vault, const PeerID& target, const ByteBuffer& data)
	{
		Run("ExecuteCallback", [&]() {
			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);
			Exc::Test(!v.IsLocked(), ErrorKind::Reentrant);

			Auth::RequireAuthority(ctx, v.m_Authority, authority);

			CallArgs args;
			args.m_Controller = m_Controller;
			args.m_Vault = vault;
			args.m_Data = data;

			m_Mediator.Call(vault, target, TrustedTargets::s_szValidator, args, PostCallInvariant(), [](Vault&, Account&) {});
		});
	}

	///////////////////////
	// Closures

	Amount Processor::CloseVault(const AuthContext& ctx, const PeerID& authority, const Address& vault, const Address& dst)
	{
		Amount res = 0;
		Run("CloseVault", [&]() {
			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);

			ClosureRequest r;
			r.m_Account = vault;
			r.m_Destination = dst;
			r.m_Expected = v.m_Authority;
			res = m_Closure.Close(ctx, authority, r);
		});
		return res;
	}

	Amount Processor::CloseVaultTo(const AuthContext& ctx, const PeerID& authority, const Address& vault, const Address& dst)
	{
		Amount res = 0;
		Run("CloseVaultTo", [&]() {
			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);

			ClosureRequest r;
			r.m_Account = vault;
			r.m_Destination = dst;
			r.m_Expected = v.m_Creator;
			res = m_Closure.Close(ctx, authority, r);
		});
		return res;
	}

	Amount Processor::CloseVaultIfEmpty(const AuthContext& ctx, const PeerID& authority, const Address& vault, const Address& dst)
	{
		Amount res = 0;
		Run("CloseVaultIfEmpty", [&]() {
			Vault v;
			Account acc;
			ValidateVault(vault, v, acc);

			ClosureRequest r;
			r.m_Account = vault;
			r.m_Destination = dst;
			r.m_Expected = v.m_Authority;
			r.m_bRequireEmpty = true;
			res = m_Closure.Close(ctx, authority, r);
		});
		return res;
	}

	Amount Processor::CloseUser(const AuthContext& ctx, const PeerID& authority, const Address& user, const Address& dst)
	{
		Amount res = 0;
		Run("CloseUser", [&]() {
			UserAccount u;
			Account acc;
			ValidateUser(user, u, acc);

			ClosureRequest r;
			r.m_Account = user;
			r.m_Destination = dst;
			r.m_Expected = u.m_Authority;
			res = m_Closure.Close(ctx, authority, r);
		});
		return res;
	}

} // namespace warden
