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
#include <boost/intrusive/list.hpp>

namespace srcverify {
namespace intrusive
{
	// Intrusive list that owns its heap-allocated entries. Whatever is still linked is deleted with the list
	template <typename TEntry>
	struct owning_list
		:public boost::intrusive::list<TEntry>
	{
		typedef boost::intrusive::list<TEntry> Base;

		owning_list() = default;
		owning_list(const owning_list&) = delete;
		owning_list& operator = (const owning_list&) = delete;

		~owning_list() { Clear(); }

		TEntry& Create_back()
		{
			TEntry* p = new TEntry;
			Base::push_back(*p);
			return *p;
		}

		void Delete(TEntry& x)
		{
			Base::erase(Base::s_iterator_to(x));
			delete &x;
		}

		void Clear()
		{
			Base::clear_and_dispose([](TEntry* p) { delete p; });
		}
	};

} // namespace intrusive
} // namespace srcverify
