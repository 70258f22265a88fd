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
#include "common.h"
#include <boost/intrusive/list.hpp>
#include <boost/intrusive/set.hpp>

namespace warden {
namespace intrusive
{
	// Heap-allocated elements, released together with the container
	template <typename TBase>
	struct owning
		:public TBase
	{
		typedef typename TBase::value_type TEntry;

		owning() = default;
		owning(const owning&) = delete;
		owning& operator = (const owning&) = delete;

		~owning() { Clear(); }

		void Delete(TEntry& x)
		{
			TBase::erase(TBase::s_iterator_to(x));
			delete &x;
		}

		void Clear()
		{
			TBase::clear_and_dispose([](TEntry* p) { delete p; });
		}
	};

	template <typename TKey>
	struct set_base_hook
		:public boost::intrusive::set_base_hook<>
	{
		TKey m_Key;
		bool operator < (const set_base_hook& x) const { return m_Key < x.m_Key; }

		// heterogeneous lookup by the bare key
		struct Comparator
		{
			bool operator()(const TKey& a, const set_base_hook& b) const { return a < b.m_Key; }
			bool operator()(const set_base_hook& a, const TKey& b) const { return a.m_Key < b; }
		};
	};

	template <typename TEntry>
	struct multiset
		:public owning<boost::intrusive::multiset<TEntry> >
	{
		template <typename TKey>
		TEntry* Create(const TKey& key)
		{
			auto p = std::make_unique<TEntry>();
			p->m_Key = key;
			this->insert(*p);
			return p.release();
		}

		template <typename TKey>
		TEntry* Find(const TKey& key)
		{
			auto it = this->find(key, typename TEntry::Comparator());
			return (this->end() == it) ? nullptr : &(*it);
		}
	};

	template <typename TEntry>
	using list = owning<boost::intrusive::list<TEntry> >;

} // namespace intrusive
} // namespace warden
