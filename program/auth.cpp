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

#include "auth.h"
#include "utility/logger.h"

namespace warden
{
	void AuthContext::Add(const PeerID& id, bool bSigned)
	{
		for (auto& x : m_vEntries)
		{
			if (x.m_ID == id)
			{
				x.m_bSigned |= bSigned;
				return;
			}
		}

		m_vEntries.push_back({ id, bSigned });
	}

	bool AuthContext::AddVerified(const PeerID& id, const Hash::Value& msg, const Curve::Signature& sig)
	{
		bool bValid = sig.IsValid(msg, id);
		if (!bValid)
			LOG_DEBUG() << "bad signature for " << id;

		Add(id, bValid);
		return bValid;
	}

	const bool* AuthContext::Find(const PeerID& id) const
	{
		for (const auto& x : m_vEntries)
			if (x.m_ID == id)
				return &x.m_bSigned;

		return nullptr;
	}

	namespace Auth
	{
		void RequireSigner(const AuthContext& ctx, const PeerID& id)
		{
			const bool* pSigned = ctx.Find(id);
			Exc::Test(pSigned != nullptr, ErrorKind::Unauthorized);
			Exc::Test(*pSigned, ErrorKind::MissingSignature);
		}

		void RequireAuthority(const AuthContext& ctx, const PeerID& stored, const PeerID& supplied)
		{
			Exc::Test(stored == supplied, ErrorKind::Unauthorized);
			RequireSigner(ctx, stored);
		}

	} // namespace Auth

} // namespace warden
