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
#include "mediator.h"
#include "closure.h"
#include "core/derivation.h"
#include <functional>

namespace warden
{
	// Operation entry points of the controller. Each operation is all-or-nothing: on failure every change it made
	// (nested operations run from a call target included) is rolled back, and the error is rethrown
	class Processor
	{
		Processor(const Processor&) = delete;
		Processor& operator = (const Processor&) = delete;

		IStore& m_Store;
		PeerID m_Controller;
		PeerID m_Admin;

		Mediator m_Mediator;
		ClosureEngine m_Closure;

		void Run(const char* szOp, const std::function<void()>&);

		void ValidateUser(const Address&, UserAccount&, Account&);
		void ValidateVault(const Address&, Vault&, Account&);

		template <typename T>
		void SaveRecord(const Address& addr, Account& acc, const T& x)
		{
			Records::Save(acc, x);
			m_Store.Put(addr, acc);
		}

		// checked add, then the per-account cap (ExceedsMaxSupply)
		static void CreditPoints(UserAccount&, Amount);

		void LoadWallet(const Address&, Account&);
		void CreditWallet(const Address&, Amount);
		void DebitWallet(const Address&, Amount);

		// derives the canonical address, fails AlreadyInUse if it's live
		Address Allocate(const Derivation&, uint8_t& nBump);

	public:
		Processor(IStore&, IDelegation&, const TrustedTargets&, const PeerID& controller, const PeerID& admin);

		const PeerID& get_Controller() const { return m_Controller; }
		const PeerID& get_Admin() const { return m_Admin; }

		Derivation get_UserDerivation(const PeerID& authority) const;
		Derivation get_VaultDerivation(const PeerID& creator) const;

		Address InitializeUser(const AuthContext&, const PeerID& authority, const std::string& szName);
		void GrantPoints(const AuthContext&, const PeerID& admin, const Address& user, Amount);
		void TransferPoints(const AuthContext&, const PeerID& authority, const Address& from, const Address& to, Amount);
		void BurnPoints(const AuthContext&, const PeerID& authority, const Address& user, Amount);

		static const uint32_t s_BpsMax = 10000;

		// credits amount * rate less a fee of feeBps basis points, returns the credited value
		Amount CalculateReward(const AuthContext&, const PeerID& authority, const Address& user, Amount, Amount rate, uint32_t feeBps);

		Address InitializeVault(const AuthContext&, const PeerID& authority, Amount initial);
		void Deposit(const AuthContext&, const PeerID& depositor, const Address& vault, Amount);
		void Withdraw(const AuthContext&, const PeerID& authority, const Address& vault, Amount);
		void Transfer(const AuthContext&, const PeerID& authority, const Address& from, const Address& to, Amount);
		void ChangeAuthority(const AuthContext&, const PeerID& authority, const Address& vault, const PeerID& newAuthority);
		void BindCallback(const AuthContext&, const PeerID& authority, const Address& vault, const PeerID& target);

		// guarded delegations
		void FlashLoan(const AuthContext&, const PeerID& authority, const Address& vault, const PeerID& target, Amount, Amount fee);
		void SwapTokens(const AuthContext&, const PeerID& authority, const Address& vault, const PeerID& dex, Amount);
		void ExecuteCallback(const AuthContext&, const PeerID& authority, const Address& vault, const PeerID& target, const ByteBuffer& data);

		// closures return the value moved to the destination
		Amount CloseVault(const AuthContext&, const PeerID& authority, const Address& vault, const Address& dst); // dst must be the authority
		Amount CloseVaultTo(const AuthContext&, const PeerID& authority, const Address& vault, const Address& dst); // dst must be the creator
		Amount CloseVaultIfEmpty(const AuthContext&, const PeerID& authority, const Address& vault, const Address& dst);
		Amount CloseUser(const AuthContext&, const PeerID& authority, const Address& user, const Address& dst);
	};

} // namespace warden
