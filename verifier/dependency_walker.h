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
#include "../core/package.h"

namespace srcverify {
namespace verifier {

	struct DependencyPackage
	{
		std::string m_Name;
		Address m_Address;
		std::vector<const CompiledModule*> m_vModules;
	};

	struct DependencyClosure
	{
		// independently published dependencies, one per address, sorted by address
		std::vector<DependencyPackage> m_vPublished;

		// modules of dependencies compiled against the placeholder. They were published as a part of the root
		std::vector<const CompiledModule*> m_vBundled;
	};

	// Collects the transitive dependencies of a package. The result references modules of the input package,
	// which must outlive it.
	class DependencyWalker
	{
	public:
		static DependencyClosure Walk(const CompiledPackage&);
	};

} // namespace verifier
} // namespace srcverify
