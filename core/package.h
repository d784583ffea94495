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
#include "module_binary.h"
#include <map>
#include <memory>
#include <variant>

namespace srcverify
{
	struct CompiledModule
	{
		std::string m_Name;
		Address m_SelfAddress; // as declared. Zero if compiled against the placeholder
		ByteBuffer m_Bytes;

		CompiledModule() :m_SelfAddress(Zero) {}

		static CompiledModule FromBinary(const ModuleBinary&);
	};

	// Output of the build toolchain, read-only for the verifier
	struct CompiledPackage
	{
		typedef std::shared_ptr<const CompiledPackage> Ptr;

		std::string m_Name;
		std::map<std::string, Address> m_Addresses; // named addresses resolved at compile time
		std::vector<CompiledModule> m_vModules;
		std::map<std::string, Ptr> m_Dependencies;

		// address-table entry for the own name, otherwise the declared address of the modules
		Address get_SelfAddress() const;

		// Returns false and the offending module if a module declares a concrete address other than the package's
		bool CheckConsistency(std::string* pModule = nullptr) const;

		const CompiledModule* FindModule(const std::string&) const;
	};

	namespace OnChain
	{
		struct Package
		{
			std::map<std::string, ByteBuffer> m_Modules;
		};

		struct NonPackageObject
		{
			Address m_Address;
			std::string m_Description;
		};

		struct NotFound
		{
			Address m_Address;
			std::string m_Detail;
		};
	}

	typedef std::variant<OnChain::Package, OnChain::NonPackageObject, OnChain::NotFound> OnChainPackageData;

} // namespace srcverify
