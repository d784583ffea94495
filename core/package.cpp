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


#include "package.h"

namespace srcverify
{
	CompiledModule CompiledModule::FromBinary(const ModuleBinary& mb)
	{
		mb.TestValid();

		CompiledModule ret;
		ret.m_Name = mb.get_Name();
		ret.m_SelfAddress = mb.get_SelfAddress();
		mb.Save(ret.m_Bytes);
		return ret;
	}

	Address CompiledPackage::get_SelfAddress() const
	{
		auto it = m_Addresses.find(m_Name);
		if (m_Addresses.end() != it)
			return it->second;

		for (const auto& m : m_vModules)
			if (m.m_SelfAddress != Zero)
				return m.m_SelfAddress;

		return Address(Zero);
	}

	bool CompiledPackage::CheckConsistency(std::string* pModule) const
	{
		Address addr = get_SelfAddress();

		for (const auto& m : m_vModules)
		{
			if ((m.m_SelfAddress == Zero) || (m.m_SelfAddress == addr))
				continue;

			if (pModule)
				*pModule = m.m_Name;
			return false;
		}

		return true;
	}

	const CompiledModule* CompiledPackage::FindModule(const std::string& sName) const
	{
		for (const auto& m : m_vModules)
			if (m.m_Name == sName)
				return &m;
		return nullptr;
	}

} // namespace srcverify
