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

#include "mediator.h"
#include "utility/logger.h"

namespace warden
{
	const char* CallStatus::get_Name(Enum e)
	{
		switch (e)
		{
		case Ok: return "Ok";
		case Failed: return "Failed";
		default:
			break;
		}
		return "Unknown";
	}

	///////////////////////
	// CallRouter

	void CallRouter::Register(const PeerID& id, ICallTarget& x)
	{
		m_Targets[id] = &x;
	}

	void CallRouter::Unregister(const PeerID& id)
	{
		m_Targets.erase(id);
	}

	CallStatus::Enum CallRouter::Invoke(const PeerID& target, const CallArgs& args)
	{
		auto it = m_Targets.find(target);
		if (m_Targets.end() == it)
		{
			LOG_WARNING() << "call target " << target << " not registered";
			return CallStatus::Unknown;
		}

		if (m_Depth >= s_MaxDepth)
		{
			LOG_WARNING() << "call depth exceeded";
			return CallStatus::Failed;
		}

		struct DepthGuard
		{
			uint32_t& m_Val;
			DepthGuard(uint32_t& x) :m_Val(x) { m_Val++; }
			~DepthGuard() { m_Val--; }
		} dg(m_Depth);

		LOG_VERBOSE() << "invoke " << target << " depth=" << m_Depth;
		return it->second->Invoke(args);
	}

	///////////////////////
	// TrustedTargets

	TrustedTargets::TrustedTargets()
	{
		static const uint8_t s_pDex[] = {
			0x11,0xb0,0x68,0x06,0x4e,0x1b,0x5d,0xc1,0xba,0x21,0x1d,0x60,0x88,0x69,0xf1,0xb4,
			0x7a,0x84,0x07,0x21,0x9d,0xd8,0x0d,0xec,0xa5,0xf6,0xbe,0xfd,0x14,0xc4,0x72,0x81
		};

		static const uint8_t s_pValidator[] = {
			0x47,0xe0,0xfa,0x71,0x82,0xf9,0xd7,0xb6,0xba,0x10,0x1e,0xca,0x12,0x3f,0xaa,0xe6,
			0x63,0x02,0x65,0xb0,0xb3,0xa4,0x8c,0xa3,0x98,0xdb,0x2c,0x15,0x76,0xe2,0xcf,0x6f
		};

		m_Roles[s_szDex] = PeerID(s_pDex);
		m_Roles[s_szValidator] = PeerID(s_pValidator);
	}

	TrustedTargets::TrustedTargets(const Config& cfg)
		:TrustedTargets()
	{
		for (const auto& s : cfg.get_string_list("trusted_targets"))
		{
			auto n = s.find(':');
			if (std::string::npos == n)
				throw std::runtime_error("trusted target must be role:hex, got " + s);

			PeerID id;
			if (!id.Scan(std::string_view(s).substr(n + 1)))
				throw std::runtime_error("bad trusted target identity: " + s);

			Set(s.substr(0, n), id);
		}
	}

	void TrustedTargets::Set(const std::string& szRole, const PeerID& id)
	{
		Exc::Test(!szRole.empty() && (id != Zero), ErrorKind::InvalidArgument);
		m_Roles[szRole] = id;
	}

	const PeerID* TrustedTargets::Find(const std::string& szRole) const
	{
		auto it = m_Roles.find(szRole);
		return (m_Roles.end() == it) ? nullptr : &it->second;
	}

	bool TrustedTargets::IsTrusted(const std::string& szRole, const PeerID& id) const
	{
		const PeerID* pID = Find(szRole);
		return pID && (*pID == id);
	}

	bool TrustedTargets::IsTrustedAny(const PeerID& id) const
	{
		for (const auto& x : m_Roles)
			if (x.second == id)
				return true;
		return false;
	}

	///////////////////////
	// PostCallInvariant

	void PostCallInvariant::Verify(const Vault& vCall, const Vault& vNow, Amount nValue) const
	{
		Exc::CheckpointTxt cp("post-call");

		if (Balance::Unchanged == m_eBalance)
			Exc::Test(vNow.m_Balance == vCall.m_Balance, ErrorKind::UnexpectedStateChange);
		else
			Exc::Test(vNow.m_Balance >= m_Reference, ErrorKind::NotRepaid);

		Exc::Test(vNow.m_Creator == vCall.m_Creator, ErrorKind::UnexpectedStateChange);
		Exc::Test(vNow.m_Authority == vCall.m_Authority, ErrorKind::UnexpectedStateChange);
		Exc::Test(vNow.m_Callback == vCall.m_Callback, ErrorKind::UnexpectedStateChange);

		Exc::Test(vNow.IsLocked(), ErrorKind::InvariantViolated);
		Exc::Test(nValue == vNow.m_Balance, ErrorKind::InvariantViolated);
	}

	///////////////////////
	// Mediator

	Mediator::Mediator(IStore& s, IDelegation& d, const TrustedTargets& t, const PeerID& controller)
		:m_Store(s)
		,m_Delegation(d)
		,m_Trusted(t)
		,m_Controller(controller)
	{
	}

	void Mediator::ValidateTarget(const PeerID& target, const char* szRole, const Vault& v) const
	{
		bool bOk = szRole ?
			m_Trusted.IsTrusted(szRole, target) :
			(m_Trusted.IsTrustedAny(target) || ((v.m_Callback != Zero) && (v.m_Callback == target)));

		Exc::Test(bOk, ErrorKind::InvalidProgram);
	}

	void Mediator::Call(const Address& addrVault, const PeerID& target, const char* szRole, const CallArgs& args, const PostCallInvariant& inv, const Effect& fnEffect)
	{
		Exc::CheckpointTxt cp("mediator");

		Account acc;
		Vault v;
		m_Store.Get(addrVault, acc);
		Records::Load(v, acc, m_Controller);

		ValidateTarget(target, szRole, v);
		Exc::Test(!v.IsLocked(), ErrorKind::Reentrant);

		v.m_Locked = 1;
		fnEffect(v, acc);

		Records::Save(acc, v);
		m_Store.Put(addrVault, acc);

		Vault vCall = v;

		CallStatus::Enum eStatus = m_Delegation.Invoke(target, args);
		if (CallStatus::Ok != eStatus)
		{
			LOG_WARNING() << "call to " << target << " returned " << CallStatus::get_Name(eStatus);
			Exc::Fail(ErrorKind::CallbackFailed, CallStatus::get_Name(eStatus));
		}

		// the in-memory copy is stale from now on
		m_Store.Get(addrVault, acc);
		Records::Load(v, acc, m_Controller);

		inv.Verify(vCall, v, acc.m_Value);

		v.m_Locked = 0;
		Records::Save(acc, v);
		m_Store.Put(addrVault, acc);
	}

} // namespace warden
