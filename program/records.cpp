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

#include "records.h"
#include "core/hash.h"

namespace warden
{
	SchemaTag get_SchemaTag(const char* szName)
	{
		SchemaTag tag;
		Hash::Processor()
			<< "warden.schema"
			<< std::string(szName)
			>> tag;
		return tag;
	}

	void UserAccount::set_Name(const std::string& s)
	{
		Exc::Test(s.size() <= s_NameMax, ErrorKind::InvalidArgument);
		m_Name = s;
	}

	namespace Records
	{
		bool HasTag(const Account& acc, const SchemaTag& tag)
		{
			return
				(acc.m_Data.size() >= sizeof(SchemaTag)) &&
				!memcmp(acc.m_Data.data(), tag.m_pData, sizeof(SchemaTag));
		}

		Record LoadAny(const Account& acc, const PeerID& controller)
		{
			Exc::Test(acc.m_Owner == controller, ErrorKind::OwnershipMismatch);

			if (HasTag(acc, get_Tag<UserAccount>()))
			{
				UserAccount x;
				Load(x, acc, controller);
				return x;
			}

			if (HasTag(acc, get_Tag<Vault>()))
			{
				Vault x;
				Load(x, acc, controller);
				return x;
			}

			Exc::Fail(ErrorKind::SchemaMismatch);
		}

		const PeerID& get_Authority(const Record& r)
		{
			return std::visit([](const auto& x) -> const PeerID& { return x.get_Authority(); }, r);
		}

		Amount get_Residual(const Record& r)
		{
			return std::visit([](const auto& x) { return x.get_Residual(); }, r);
		}

		const char* get_Name(const Record& r)
		{
			return std::visit([](const auto& x) -> const char* { return x.s_szName; }, r);
		}

	} // namespace Records

} // namespace warden
