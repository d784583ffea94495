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


#include "fixtures.h"
#include "core/module_binary.h"

namespace srcverify {
namespace verifier {
namespace test {

	namespace
	{
		Address LookupAddress(const NamedAddresses& names, const std::string& sPackage)
		{
			auto it = names.find(sPackage);
			return (names.end() == it) ? Address(Zero) : it->second;
		}
	}

	CompiledModule CompileModule(const std::string& sPackage, const ModuleSource& src, const NamedAddresses& names)
	{
		ModuleBinary mb;
		mb.m_iSelf = mb.AddHandle(LookupAddress(names, sPackage), src.m_Name);

		ByteBuffer& code = mb.m_Code;
		for (const auto& [sPkg, sModule] : src.m_vRefs)
		{
			uint32_t iHandle = mb.AddHandle(LookupAddress(names, sPkg), sModule);
			code.push_back(0x11); // call
			code.push_back(static_cast<uint8_t>(iHandle));
		}

		ByteBuffer& c = mb.m_vConstants.emplace_back();
		for (uint32_t i = 0; i < sizeof(src.m_Constant); i++)
			c.push_back(static_cast<uint8_t>(src.m_Constant >> (i << 3)));

		code.push_back(0x07); // ld.const 0
		code.push_back(0);
		code.push_back(0x02); // ret

		return CompiledModule::FromBinary(mb);
	}

	CompiledPackage::Ptr CompilePackage(const std::string& sName, const std::vector<ModuleSource>& vSrc, const NamedAddresses& names, const std::vector<CompiledPackage::Ptr>& vDeps)
	{
		auto pPkg = std::make_shared<CompiledPackage>();
		pPkg->m_Name = sName;
		pPkg->m_Addresses = names;

		for (const auto& src : vSrc)
			pPkg->m_vModules.push_back(CompileModule(sName, src, names));

		for (const auto& pDep : vDeps)
			pPkg->m_Dependencies[pDep->m_Name] = pDep;

		return pPkg;
	}

	CompiledPackage::Ptr CompileB(const NamedAddresses& names, const Sources& s)
	{
		std::vector<ModuleSource> vSrc;

		ModuleSource& c = vSrc.emplace_back();
		c.m_Name = "c";
		c.m_Constant = s.m_ConstC;

		if (s.m_WithModuleD)
		{
			ModuleSource& d = vSrc.emplace_back();
			d.m_Name = "d";
			d.m_vRefs.emplace_back("b", "c");
			d.m_Constant = 7;
		}

		return CompilePackage("b", vSrc, names);
	}

	CompiledPackage::Ptr CompileA(const NamedAddresses& names, const CompiledPackage::Ptr& pB, const Sources& s)
	{
		std::vector<ModuleSource> vSrc;

		ModuleSource& a = vSrc.emplace_back();
		a.m_Name = "a";
		a.m_vRefs.emplace_back("b", "c");
		a.m_Constant = s.m_ConstA;

		return CompilePackage("a", vSrc, names, { pB });
	}

} // namespace test
} // namespace verifier
} // namespace srcverify
