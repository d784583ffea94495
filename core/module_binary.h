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
#include "address.h"
#include <stdexcept>
#include <vector>

namespace srcverify
{
	struct ModuleFormatError
		:public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	// Binary layout of a compiled module.
	// Every address the module mentions (its own and those of the modules it references) lives in the
	// address pool, handles refer to it by index. This keeps address substitution a pool-only rewrite.
	struct ModuleBinary
	{
		static const uint32_t s_Magic = 0x4d4f4453; // "SDOM" in LE
		static const uint32_t s_Version = 1;

		struct Handle
		{
			uint32_t m_iAddress = 0;
			uint32_t m_iName = 0;

			SERIALIZE(m_iAddress, m_iName)
		};

		uint32_t m_Magic = s_Magic;
		uint32_t m_Version = s_Version;
		uint32_t m_iSelf = 0; // index in m_vHandles

		std::vector<Address> m_vAddresses;
		std::vector<std::string> m_vIdentifiers;
		std::vector<Handle> m_vHandles;
		std::vector<ByteBuffer> m_vConstants;
		ByteBuffer m_Code;

		SERIALIZE(m_Magic, m_Version, m_iSelf, m_vAddresses, m_vIdentifiers, m_vHandles, m_vConstants, m_Code)

		const std::string& get_Name() const;
		const Address& get_SelfAddress() const;

		const Handle& get_Handle(uint32_t iHandle) const;
		const std::string& get_HandleName(uint32_t iHandle) const;
		const Address& get_HandleAddress(uint32_t iHandle) const;

		// validating load, throws ModuleFormatError
		void Load(const Blob&);
		void Save(ByteBuffer&) const;

		void TestValid() const;

		// Helpers for building a module
		uint32_t AddAddress(const Address&);
		uint32_t AddIdentifier(const std::string&);
		uint32_t AddHandle(const Address&, const std::string& sName);
	};

	// Rewrites every pool entry equal to 'placeholder' to 'target'.
	// If nothing matches the output is byte-identical to the input. Returns the number of entries rewritten.
	uint32_t SubstituteAddress(const Blob& module, const Address& placeholder, const Address& target, ByteBuffer& out);

} // namespace srcverify
