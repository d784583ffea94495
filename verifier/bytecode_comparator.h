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
#include "errors.h"
#include "../core/package.h"

namespace srcverify {
namespace verifier {

	class BytecodeComparator
	{
	public:
		enum struct Policy {
			FirstOnly,
			All,
		};

		struct Input
		{
			std::string m_Package;
			Address m_Address; // where the package lives on-chain
			Address m_Placeholder = Address(Zero); // rewritten to m_Address in local modules
			std::vector<const CompiledModule*> m_vLocal;
		};

		// Walks the union of module names in lexicographic order. Returns true if there were no discrepancies
		static bool Compare(const Input&, const OnChain::Package&, Policy, std::vector<VerificationError>& vErrs);
	};

} // namespace verifier
} // namespace srcverify
