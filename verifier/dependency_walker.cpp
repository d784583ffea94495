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


#include "dependency_walker.h"
#include <deque>
#include <set>

namespace srcverify {
namespace verifier {

	namespace
	{
		void MergeModules(std::vector<const CompiledModule*>& vDst, const std::vector<CompiledModule>& vSrc)
		{
			for (const auto& m : vSrc)
			{
				bool bDup = false;
				for (const auto* p : vDst)
				{
					if (p->m_Name == m.m_Name)
					{
						bDup = true;
						break;
					}
				}

				if (!bDup)
					vDst.push_back(&m);
			}
		}
	}

	DependencyClosure DependencyWalker::Walk(const CompiledPackage& root)
	{
		DependencyClosure ret;

		std::map<Address, DependencyPackage> mapPublished;
		std::set<const CompiledPackage*> setVisited;
		setVisited.insert(&root);

		std::deque<std::pair<std::string, const CompiledPackage*> > queue;
		for (const auto& [sName, pDep] : root.m_Dependencies)
			if (pDep)
				queue.emplace_back(sName, pDep.get());

		while (!queue.empty())
		{
			auto [sName, pPkg] = queue.front();
			queue.pop_front();

			if (!setVisited.insert(pPkg).second)
				continue;

			for (const auto& [sSub, pSub] : pPkg->m_Dependencies)
				if (pSub)
					queue.emplace_back(sSub, pSub.get());

			// unpublished packages are told apart by instance, not by name
			Address addr = pPkg->get_SelfAddress();
			if (addr.IsPlaceholder())
			{
				MergeModules(ret.m_vBundled, pPkg->m_vModules);
				continue;
			}

			auto it = mapPublished.find(addr);
			if (mapPublished.end() == it)
			{
				it = mapPublished.emplace(addr, DependencyPackage()).first;
				it->second.m_Name = sName;
				it->second.m_Address = addr;
			}

			MergeModules(it->second.m_vModules, pPkg->m_vModules);
		}

		ret.m_vPublished.reserve(mapPublished.size());
		for (auto& [addr, dp] : mapPublished)
			ret.m_vPublished.push_back(std::move(dp));

		return ret;
	}

} // namespace verifier
} // namespace srcverify
