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
#include "core/types.h"
#include "utility/containers.h"

namespace warden
{
	struct Account
	{
		PeerID m_Owner = s_SystemID;
		Amount m_Value = 0;
		ByteBuffer m_Data;
	};

	// System of record. Every read is authoritative, every write is journaled until the enclosing mark is rolled back or discarded
	struct IStore
	{
		typedef size_t Mark;

		virtual ~IStore() {}

		// returns false if the address is not listed (acc is then reset to an empty system-owned account)
		virtual bool Get(const Address&, Account&) = 0;
		virtual void Put(const Address&, const Account&) = 0;

		// Atomic: moves the whole value of src to dst (Overflow if it doesn't fit), clears and delists src.
		// dst is created as a system-owned wallet if missing
		virtual void Close(const Address& src, const Address& dst) = 0;

		virtual Mark get_Mark() const = 0;
		virtual void Rollback(Mark) = 0;
	};

	class MemStore
		:public IStore
	{
		struct Entry
			:public intrusive::set_base_hook<Address>
		{
			Account m_Acc;
		};

		intrusive::multiset<Entry> m_Accounts;

		struct Action
			:public boost::intrusive::list_base_hook<>
		{
			Address m_Addr;
			bool m_bExisted;
			Account m_Prev;
		};

		intrusive::list<Action> m_lstUndo;

		void SaveUndo(const Address&, const Entry*);
		void PutRaw(const Address&, const Account&);
		void Delist(const Address&);

	public:
		bool Get(const Address&, Account&) override;
		void Put(const Address&, const Account&) override;
		void Close(const Address& src, const Address& dst) override;

		Mark get_Mark() const override;
		void Rollback(Mark) override;

		// forgets the journal. The current state becomes final
		void Commit();

		size_t get_Count() const { return m_Accounts.size(); }

		// funds a system-owned wallet, outside of any journal
		void SetWallet(const Address&, Amount);
	};

} // namespace warden
