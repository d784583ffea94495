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
#include "core/package.h"

namespace srcverify {
namespace verifier {
namespace test {

	// A toy build toolchain. Named addresses missing from the table compile to the placeholder
	typedef std::map<std::string, Address> NamedAddresses;

	struct ModuleSource
	{
		std::string m_Name;
		std::vector<std::pair<std::string, std::string> > m_vRefs; // package, module
		uint64_t m_Constant = 0;
	};

	CompiledModule CompileModule(const std::string& sPackage, const ModuleSource&, const NamedAddresses&);

	CompiledPackage::Ptr CompilePackage(
		const std::string& sName,
		const std::vector<ModuleSource>&,
		const NamedAddresses&,
		const std::vector<CompiledPackage::Ptr>& vDeps = std::vector<CompiledPackage::Ptr>());

	// Sources of the sample packages:
	//	package b: module c (holds a constant), module d (calls c)
	//	package a: module a (holds a constant, calls b::c), depends on b
	struct Sources
	{
		uint64_t m_ConstC = 43;
		uint64_t m_ConstA = 123;
		bool m_WithModuleD = true;
	};

	CompiledPackage::Ptr CompileB(const NamedAddresses&, const Sources& = Sources());
	CompiledPackage::Ptr CompileA(const NamedAddresses&, const CompiledPackage::Ptr& pB, const Sources& = Sources());

} // namespace test
} // namespace verifier
} // namespace srcverify
