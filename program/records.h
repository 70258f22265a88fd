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
#include "store.h"
#include "core/exc.h"
#include "utility/serialize.h"
#include <string>
#include <variant>

namespace warden
{
	// Leading 8 bytes of every record: SHA-256("warden.schema" | type name), truncated
	typedef uintBig_t<8> SchemaTag;

	SchemaTag get_SchemaTag(const char* szName);

	struct UserAccount
	{
		static constexpr char s_szName[] = "UserAccount";
		static const uint32_t s_NameMax = 50;
		static const Amount s_PointsMax = 1000000000000000000ULL; // no account ever holds more

		PeerID m_Authority = Zero;
		std::string m_Name;
		Amount m_Points = 0;
		uint8_t m_Bump = 0;

		SERIALIZE(m_Authority, m_Name, m_Points, m_Bump);

		void set_Name(const std::string&); // InvalidArgument if too long

		const PeerID& get_Authority() const { return m_Authority; }
		Amount get_Residual() const { return m_Points; }

		bool IsSane() const { return m_Name.size() <= s_NameMax; }
	};

	struct Vault
	{
		static constexpr char s_szName[] = "Vault";

		PeerID m_Creator = Zero;
		PeerID m_Authority = Zero;
		Amount m_Balance = 0;
		uint8_t m_Bump = 0;
		uint8_t m_Locked = 0;
		PeerID m_Callback = Zero; // zero if none

		SERIALIZE(m_Creator, m_Authority, m_Balance, m_Bump, m_Locked, m_Callback);

		const PeerID& get_Authority() const { return m_Authority; }
		Amount get_Residual() const { return m_Balance; }

		bool IsLocked() const { return !!m_Locked; }
		bool IsSane() const { return m_Locked <= 1; }
	};

	typedef std::variant<UserAccount, Vault> Record;

	namespace Records
	{
		template <typename T>
		const SchemaTag& get_Tag()
		{
			static const SchemaTag s_Tag = get_SchemaTag(T::s_szName);
			return s_Tag;
		}

		bool HasTag(const Account&, const SchemaTag&);

		// decodes the body that follows the tag. False unless it's consumed exactly and sane
		template <typename T>
		bool Decode(T& res, const Account& acc)
		{
			Deserializer der;
			der.reset(acc.m_Data.data() + sizeof(SchemaTag), acc.m_Data.size() - sizeof(SchemaTag));

			try {
				der & res;
			}
			catch (const std::exception&) {
				// truncated or malformed body
				return false;
			}

			return !der.bytes_left() && res.IsSane();
		}

		// Fails OwnershipMismatch unless the account is owned by the controller, SchemaMismatch unless it holds a T
		template <typename T>
		void Load(T& res, const Account& acc, const PeerID& controller)
		{
			Exc::Test(acc.m_Owner == controller, ErrorKind::OwnershipMismatch);
			Exc::Test(HasTag(acc, get_Tag<T>()), ErrorKind::SchemaMismatch);
			Exc::Test(Decode(res, acc), ErrorKind::SchemaMismatch);
		}

		Record LoadAny(const Account&, const PeerID& controller);

		template <typename T>
		void Save(Account& acc, const T& x)
		{
			Serializer ser;
			ser & x;

			ByteBuffer body;
			ser.swap_buf(body);

			const SchemaTag& tag = get_Tag<T>();
			acc.m_Data.assign(tag.m_pData, tag.m_pData + sizeof(SchemaTag));
			acc.m_Data.insert(acc.m_Data.end(), body.begin(), body.end());
		}

		const PeerID& get_Authority(const Record&);
		Amount get_Residual(const Record&);
		const char* get_Name(const Record&);

	} // namespace Records

} // namespace warden
