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


#include "bytecode_comparator.h"

namespace srcverify {
namespace verifier {

	bool BytecodeComparator::Compare(const Input& inp, const OnChain::Package& onChain, Policy ePolicy, std::vector<VerificationError>& vErrs)
	{
		std::map<std::string, const CompiledModule*> mapLocal;
		for (const auto* pModule : inp.m_vLocal)
			mapLocal.emplace(pModule->m_Name, pModule);

		size_t nErrs0 = vErrs.size();
		auto itL = mapLocal.begin();
		auto itR = onChain.m_Modules.begin();

		ByteBuffer bufNormalized;

		while ((mapLocal.end() != itL) || (onChain.m_Modules.end() != itR))
		{
			if ((ePolicy == Policy::FirstOnly) && (vErrs.size() > nErrs0))
				break;

			if ((onChain.m_Modules.end() == itR) || ((mapLocal.end() != itL) && (itL->first < itR->first)))
			{
				vErrs.emplace_back(Err::OnChainDependencyNotFound{ inp.m_Package, itL->first });
				++itL;
				continue;
			}

			if ((mapLocal.end() == itL) || (itR->first < itL->first))
			{
				vErrs.emplace_back(Err::LocalDependencyNotFound{ inp.m_Address, itR->first });
				++itR;
				continue;
			}

			const CompiledModule& m = *itL->second;
			try {
				SubstituteAddress(m.m_Bytes, inp.m_Placeholder, inp.m_Address, bufNormalized);
			}
			catch (const ModuleFormatError& e) {
				vErrs.emplace_back(Err::InvalidModule{ m.m_Name, e.what() });
				++itL;
				++itR;
				continue;
			}

			if (bufNormalized != itR->second)
				vErrs.emplace_back(Err::ModuleBytecodeMismatch{ inp.m_Address, inp.m_Package, m.m_Name });

			++itL;
			++itR;
		}

		return vErrs.size() == nErrs0;
	}

} // namespace verifier
} // namespace srcverify
