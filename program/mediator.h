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
#include "records.h"
#include "utility/config.h"
#include <functional>
#include <map>

namespace warden
{
	struct CallStatus
	{
		enum Enum {
			Ok,
			Failed,
			Unknown, // no signal, e.g. the target isn't deployed
		};

		static const char* get_Name(Enum);
	};

	// The minimal set passed across the call boundary
	struct CallArgs
	{
		PeerID m_Controller = Zero;
		Address m_Vault = Zero;
		Amount m_Amount = 0;
		Amount m_Fee = 0;
		ByteBuffer m_Data;
	};

	struct ICallTarget
	{
		virtual ~ICallTarget() {}
		virtual CallStatus::Enum Invoke(const CallArgs&) = 0;
	};

	struct IDelegation
	{
		virtual ~IDelegation() {}
		virtual CallStatus::Enum Invoke(const PeerID& target, const CallArgs&) = 0;
	};

	// Dispatches to registered in-process targets. Exceptions raised by a target propagate to the caller
	class CallRouter
		:public IDelegation
	{
		std::map<PeerID, ICallTarget*> m_Targets;
		uint32_t m_Depth = 0;

	public:
		static const uint32_t s_MaxDepth = 8;

		void Register(const PeerID&, ICallTarget&);
		void Unregister(const PeerID&);

		uint32_t get_Depth() const { return m_Depth; }

		CallStatus::Enum Invoke(const PeerID& target, const CallArgs&) override;
	};

	// Process-wide allow-list of call targets by role. Immutable once constructed
	class TrustedTargets
	{
		std::map<std::string, PeerID> m_Roles;

	public:
		static constexpr char s_szDex[] = "dex";
		static constexpr char s_szValidator[] = "validator";

		// hardcoded defaults
		TrustedTargets();

		// defaults overridden by the "trusted_targets" list of "role:hex" entries
		explicit TrustedTargets(const Config&);

		void Set(const std::string& szRole, const PeerID&);
		const PeerID* Find(const std::string& szRole) const;

		bool IsTrusted(const std::string& szRole, const PeerID&) const;
		bool IsTrustedAny(const PeerID&) const;

		const std::map<std::string, PeerID>& get_Roles() const { return m_Roles; }
	};

	// Which vault fields the external call may not change, declared per guarded operation
	struct PostCallInvariant
	{
		struct Balance
		{
			enum Enum {
				Unchanged, // must equal the balance right before the call
				AtLeast, // must be at least m_Reference
			};
		};

		Balance::Enum m_eBalance = Balance::Unchanged;
		Amount m_Reference = 0;

		// vCall is the state persisted right before the call, vNow is reloaded after it
		void Verify(const Vault& vCall, const Vault& vNow, Amount nValue) const;
	};

	// Guarded delegation on behalf of a vault:
	//	target check -> lock -> effect -> invoke -> status check -> reload -> invariant -> unlock
	class Mediator
	{
		IStore& m_Store;
		IDelegation& m_Delegation;
		const TrustedTargets& m_Trusted;
		const PeerID& m_Controller;

	public:
		// applied to the locked vault (and its account) before the call
		typedef std::function<void(Vault&, Account&)> Effect;

		Mediator(IStore&, IDelegation&, const TrustedTargets&, const PeerID& controller);

		// szRole: the only accepted role. If null, any trusted target or the vault's bound callback is accepted
		void ValidateTarget(const PeerID& target, const char* szRole, const Vault&) const;

		void Call(const Address& addrVault, const PeerID& target, const char* szRole, const CallArgs&, const PostCallInvariant&, const Effect&);
	};

} // namespace warden
