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
#include "core/curve.h"
#include "core/exc.h"
#include <vector>

namespace warden
{
	// Identities referenced by the caller of an operation, each with its signer flag
	class AuthContext
	{
		struct Entry
		{
			PeerID m_ID;
			bool m_bSigned;
		};

		std::vector<Entry> m_vEntries;

		void Add(const PeerID&, bool bSigned);

	public:
		void AddSigned(const PeerID& id) { Add(id, true); }
		void AddUnsigned(const PeerID& id) { Add(id, false); }

		// The identity is always referenced, but marked signed only if the signature is valid for it
		bool AddVerified(const PeerID&, const Hash::Value& msg, const Curve::Signature&);

		// returns nullptr if absent, otherwise the signer flag
		const bool* Find(const PeerID&) const;

		void Clear() { m_vEntries.clear(); }
	};

	namespace Auth
	{
		// Unauthorized if the identity is not referenced, MissingSignature if it didn't sign
		void RequireSigner(const AuthContext&, const PeerID&);

		// The supplied authority must be the stored one, and it must have signed
		void RequireAuthority(const AuthContext&, const PeerID& stored, const PeerID& supplied);

	} // namespace Auth

} // namespace warden
