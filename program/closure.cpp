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

#include "closure.h"
#include "utility/logger.h"

namespace warden
{
	ClosureEngine::ClosureEngine(IStore& s, const PeerID& controller)
		:m_Store(s)
		,m_Controller(controller)
	{
	}

	Amount ClosureEngine::Close(const AuthContext& ctx, const PeerID& authority, const ClosureRequest& r)
	{
		Exc::CheckpointTxt cp("closure");

		Account acc;
		m_Store.Get(r.m_Account, acc);
		Record rec = Records::LoadAny(acc, m_Controller);

		if (auto pVault = std::get_if<Vault>(&rec))
			Exc::Test(!pVault->IsLocked(), ErrorKind::Reentrant);

		Auth::RequireAuthority(ctx, Records::get_Authority(rec), authority);

		Exc::Test(r.m_Destination == r.m_Expected, ErrorKind::InvalidDestination);
		Exc::Test(r.m_Destination != r.m_Account, ErrorKind::InvalidDestination);

		// the value may only land in a wallet
		Account accDst;
		m_Store.Get(r.m_Destination, accDst);
		Exc::Test((accDst.m_Owner == s_SystemID) && accDst.m_Data.empty(), ErrorKind::InvalidDestination);

		if (r.m_bRequireEmpty)
			Exc::Test(!Records::get_Residual(rec), ErrorKind::NotEmpty);

		m_Store.Close(r.m_Account, r.m_Destination);

		LOG_INFO() << Records::get_Name(rec) << " " << r.m_Account << " closed to " << r.m_Destination << " value=" << acc.m_Value;
		return acc.m_Value;
	}

} // namespace warden
