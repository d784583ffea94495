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


#include "module_binary.h"
#include "../utility/serialize.h"

namespace srcverify
{
	const ModuleBinary::Handle& ModuleBinary::get_Handle(uint32_t iHandle) const
	{
		if (iHandle >= m_vHandles.size())
			throw ModuleFormatError("module handle out of range");
		return m_vHandles[iHandle];
	}

	const std::string& ModuleBinary::get_HandleName(uint32_t iHandle) const
	{
		const Handle& h = get_Handle(iHandle);
		if (h.m_iName >= m_vIdentifiers.size())
			throw ModuleFormatError("identifier index out of range");
		return m_vIdentifiers[h.m_iName];
	}

	const Address& ModuleBinary::get_HandleAddress(uint32_t iHandle) const
	{
		const Handle& h = get_Handle(iHandle);
		if (h.m_iAddress >= m_vAddresses.size())
			throw ModuleFormatError("address index out of range");
		return m_vAddresses[h.m_iAddress];
	}

	const std::string& ModuleBinary::get_Name() const
	{
		return get_HandleName(m_iSelf);
	}

	const Address& ModuleBinary::get_SelfAddress() const
	{
		return get_HandleAddress(m_iSelf);
	}

	void ModuleBinary::TestValid() const
	{
		if (s_Magic != m_Magic)
			throw ModuleFormatError("bad module magic");
		if (m_Version > s_Version)
			throw ModuleFormatError("unsupported module version " + std::to_string(m_Version));

		for (uint32_t i = 0; i < m_vHandles.size(); i++)
		{
			get_HandleName(i);
			get_HandleAddress(i);
		}

		get_Name(); // self handle must be present
	}

	void ModuleBinary::Load(const Blob& blob)
	{
		Deserializer der;
		der.reset(blob.p, blob.n);

		try {
			der & (*this);
		}
		catch (const std::exception& e) {
			throw ModuleFormatError(std::string("module decode failed: ") + e.what());
		}

		if (der.bytes_left())
			throw ModuleFormatError("trailing bytes after module");

		TestValid();
	}

	void ModuleBinary::Save(ByteBuffer& res) const
	{
		Serializer ser;
		ser & (*this);
		ser.swap_buf(res);
	}

	uint32_t ModuleBinary::AddAddress(const Address& a)
	{
		for (uint32_t i = 0; i < m_vAddresses.size(); i++)
			if (m_vAddresses[i] == a)
				return i;

		m_vAddresses.push_back(a);
		return static_cast<uint32_t>(m_vAddresses.size() - 1);
	}

	uint32_t ModuleBinary::AddIdentifier(const std::string& s)
	{
		for (uint32_t i = 0; i < m_vIdentifiers.size(); i++)
			if (m_vIdentifiers[i] == s)
				return i;

		m_vIdentifiers.push_back(s);
		return static_cast<uint32_t>(m_vIdentifiers.size() - 1);
	}

	uint32_t ModuleBinary::AddHandle(const Address& a, const std::string& sName)
	{
		Handle h;
		h.m_iAddress = AddAddress(a);
		h.m_iName = AddIdentifier(sName);

		for (uint32_t i = 0; i < m_vHandles.size(); i++)
			if ((m_vHandles[i].m_iAddress == h.m_iAddress) && (m_vHandles[i].m_iName == h.m_iName))
				return i;

		m_vHandles.push_back(h);
		return static_cast<uint32_t>(m_vHandles.size() - 1);
	}

	uint32_t SubstituteAddress(const Blob& module, const Address& placeholder, const Address& target, ByteBuffer& out)
	{
		ModuleBinary mb;
		mb.Load(module);

		uint32_t nCount = 0;
		for (auto& a : mb.m_vAddresses)
		{
			if (a == placeholder)
			{
				a = target;
				nCount++;
			}
		}

		if (nCount)
			mb.Save(out);
		else
			module.Export(out);

		return nCount;
	}

} // namespace srcverify
