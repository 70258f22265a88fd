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

#include "store.h"
#include "core/strict.h"

namespace warden
{
	bool MemStore::Get(const Address& addr, Account& acc)
	{
		const Entry* pE = m_Accounts.Find(addr);
		if (!pE)
		{
			acc = Account();
			return false;
		}

		acc = pE->m_Acc;
		return true;
	}

	void MemStore::SaveUndo(const Address& addr, const Entry* pE)
	{
		auto pUndo = std::make_unique<Action>();
		pUndo->m_Addr = addr;
		pUndo->m_bExisted = !!pE;
		if (pE)
			pUndo->m_Prev = pE->m_Acc;

		m_lstUndo.push_back(*pUndo.release());
	}

	void MemStore::PutRaw(const Address& addr, const Account& acc)
	{
		Entry* pE = m_Accounts.Find(addr);
		if (!pE)
			pE = m_Accounts.Create(addr);

		pE->m_Acc = acc;
	}

	void MemStore::Delist(const Address& addr)
	{
		Entry* pE = m_Accounts.Find(addr);
		if (pE)
		{
			// zeroize before release
			memset0(pE->m_Acc.m_Data.data(), pE->m_Acc.m_Data.size());
			m_Accounts.Delete(*pE);
		}
	}

	void MemStore::Put(const Address& addr, const Account& acc)
	{
		SaveUndo(addr, m_Accounts.Find(addr));
		PutRaw(addr, acc);
	}

	void MemStore::Close(const Address& src, const Address& dst)
	{
		Exc::Test(src != dst, ErrorKind::InvalidDestination);

		Entry* pSrc = m_Accounts.Find(src);
		Exc::Test(pSrc != nullptr, ErrorKind::OwnershipMismatch);

		Account accDst;
		Get(dst, accDst);
		Strict::Add(accDst.m_Value, pSrc->m_Acc.m_Value); // the only failure point, nothing is modified yet

		SaveUndo(dst, m_Accounts.Find(dst));
		PutRaw(dst, accDst);

		SaveUndo(src, pSrc);
		Delist(src);
	}

	IStore::Mark MemStore::get_Mark() const
	{
		return m_lstUndo.size();
	}

	void MemStore::Rollback(Mark nTrg)
	{
		while (m_lstUndo.size() > nTrg)
		{
			Action& x = m_lstUndo.back();

			if (x.m_bExisted)
				PutRaw(x.m_Addr, x.m_Prev);
			else
				Delist(x.m_Addr);

			m_lstUndo.Delete(x);
		}
	}

	void MemStore::Commit()
	{
		m_lstUndo.Clear();
	}

	void MemStore::SetWallet(const Address& addr, Amount val)
	{
		Account acc;
		acc.m_Value = val;
		PutRaw(addr, acc);
	}

} // namespace warden
